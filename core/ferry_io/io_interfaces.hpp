// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_IO_INTERFACES_HPP
#define FERRY_IO_INTERFACES_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

#include "io_status.hpp"

namespace ferry {
namespace io {

using Bytes = std::vector<uint8_t>;

/**
 * Pull-based producer of byte segments
 */
class ISource {
public:
  virtual ~ISource() = default;

  /**
   * Pull the next segment
   *
   * Sources never yield empty segments while data remains, so an empty
   * segment on success means end-of-data. Pulling again after end-of-data
   * keeps returning an empty segment.
   *
   * @param segment Replaced with the next segment
   * @return Failure if the underlying producer failed
   */
  virtual Status next(Bytes& segment) = 0;
};

/**
 * Push-based consumer of byte segments
 */
class ISink {
public:
  virtual ~ISink() = default;

  /**
   * Accept one segment
   */
  virtual Status push(const Bytes& segment) = 0;

  /**
   * Signal end-of-data. No push may follow.
   */
  virtual Status finish() = 0;
};

/**
 * Buffered reader
 */
class IReader {
public:
  virtual ~IReader() = default;

  /**
   * Read up to max_len bytes into buffer
   *
   * May return fewer bytes than requested. Zero bytes read with a
   * successful status means end-of-data.
   *
   * @param buffer Destination, at least max_len bytes
   * @param max_len Maximum number of bytes to read
   * @param bytes_read Number of bytes actually written to buffer
   */
  virtual Status read(uint8_t* buffer, size_t max_len, size_t& bytes_read) = 0;
};

enum class SeekOrigin { Begin, Current, End };

/**
 * Reader supporting arbitrary offset reads
 */
class ISeekableReader : public IReader {
public:
  /**
   * Move the read position
   *
   * @param offset Offset relative to origin (may be negative for Current/End)
   * @param origin Seek origin
   * @param new_position Absolute position after the seek
   */
  virtual Status seek(int64_t offset, SeekOrigin origin, uint64_t& new_position) = 0;

  /**
   * Current absolute read position
   */
  virtual uint64_t position() const = 0;
};

/**
 * Buffered writer
 */
class IWriter {
public:
  virtual ~IWriter() = default;

  virtual Status write(const uint8_t* data, size_t len) = 0;

  /**
   * Flush and signal end-of-data
   */
  virtual Status close() = 0;
};

}  // namespace io
}  // namespace ferry

#endif  // FERRY_IO_INTERFACES_HPP
