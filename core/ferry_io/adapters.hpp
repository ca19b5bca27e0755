// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_IO_ADAPTERS_HPP
#define FERRY_IO_ADAPTERS_HPP

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>

#include "io_interfaces.hpp"

namespace ferry {
namespace io {

constexpr size_t kDefaultSegmentSize = 64 * 1024;

/**
 * Drive a pull-source into a push-sink
 *
 * Pulls segments until end-of-data, pushes each one, then finishes the sink.
 * The first failure from either side is returned and nothing further is
 * pulled or pushed; the sink is not finished in that case.
 *
 * @param source Source to drain
 * @param sink Sink to feed
 * @param bytes_pumped Optional out: bytes successfully pushed
 */
Status pump(ISource& source, ISink& sink, uint64_t* bytes_pumped = nullptr);

/**
 * Read until len bytes are collected or the reader reaches end-of-data
 *
 * bytes_read is less than len only at end-of-data or on failure.
 */
Status readFull(IReader& reader, uint8_t* buffer, size_t len, size_t& bytes_read);

/**
 * Buffered writer over a push-sink
 *
 * write() forwards one segment per call. close() finishes the sink exactly
 * once; a second close() is a no-op, a write() after close() fails.
 */
class SinkWriter : public IWriter {
public:
  explicit SinkWriter(std::unique_ptr<ISink> sink);

  SinkWriter(const SinkWriter&) = delete;
  SinkWriter& operator=(const SinkWriter&) = delete;

  Status write(const uint8_t* data, size_t len) override;
  Status close() override;

  bool isClosed() const {
    return closed_;
  }

private:
  std::unique_ptr<ISink> sink_;
  bool closed_ = false;
};

/**
 * Buffered reader over a pull-source
 *
 * read() pulls until the request is satisfied or the source ends. At most
 * one partially consumed segment is held between calls.
 */
class SourceReader : public IReader {
public:
  explicit SourceReader(std::unique_ptr<ISource> source);

  SourceReader(const SourceReader&) = delete;
  SourceReader& operator=(const SourceReader&) = delete;

  Status read(uint8_t* buffer, size_t max_len, size_t& bytes_read) override;

private:
  std::unique_ptr<ISource> source_;
  Bytes pending_;
  size_t pending_pos_ = 0;
  bool eof_ = false;
};

/**
 * Pull-source over a buffered reader
 *
 * Yields segments of at most segment_size bytes. Finite iff the reader is
 * finite. Consumes its reader once and cannot be restarted.
 */
class ReaderSource : public ISource {
public:
  explicit ReaderSource(std::unique_ptr<IReader> reader, size_t segment_size = kDefaultSegmentSize);

  ReaderSource(const ReaderSource&) = delete;
  ReaderSource& operator=(const ReaderSource&) = delete;

  Status next(Bytes& segment) override;

private:
  std::unique_ptr<IReader> reader_;
  size_t segment_size_;
  bool done_ = false;
};

/**
 * Pull-source over an owned buffer, cut into fixed-size segments
 */
class MemorySource : public ISource {
public:
  explicit MemorySource(Bytes data, size_t segment_size = kDefaultSegmentSize);

  Status next(Bytes& segment) override;

  uint64_t size() const {
    return data_.size();
  }

private:
  Bytes data_;
  size_t segment_size_;
  size_t offset_ = 0;
};

/**
 * Push-sink collecting everything into memory
 */
class MemorySink : public ISink {
public:
  Status push(const Bytes& segment) override;
  Status finish() override;

  const Bytes& data() const {
    return data_;
  }

  bool finished() const {
    return finished_;
  }

  size_t segmentCount() const {
    return segment_count_;
  }

private:
  Bytes data_;
  size_t segment_count_ = 0;
  bool finished_ = false;
};

/**
 * Reader over a local file
 */
class FileReader : public IReader {
public:
  /**
   * Open path for binary reading
   *
   * @param path Local file path
   * @param reader Set to the opened reader on success
   * @return IO failure if the file cannot be opened or sized
   */
  static Status open(const std::string& path, std::unique_ptr<FileReader>& reader);

  Status read(uint8_t* buffer, size_t max_len, size_t& bytes_read) override;

  uint64_t size() const {
    return size_;
  }

  const std::string& path() const {
    return path_;
  }

private:
  FileReader(const std::string& path, uint64_t size);

  std::string path_;
  uint64_t size_;
  std::ifstream file_;
};

}  // namespace io
}  // namespace ferry

#endif  // FERRY_IO_ADAPTERS_HPP
