// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_IO_SEEKABLE_READER_HPP
#define FERRY_IO_SEEKABLE_READER_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

#include "io_interfaces.hpp"

namespace ferry {
namespace io {

/**
 * Opens a fresh source positioned at the given absolute offset
 * (typically a ranged GET against the backend).
 */
using SourceFactory = std::function<Status(uint64_t offset, std::unique_ptr<ISource>& source)>;

struct SeekableReaderOptions {
  // Upper bound on retained bytes behind the pull cursor. The window may
  // exceed it by at most one segment while a read is being served.
  uint64_t max_retained_bytes = 8 * 1024 * 1024;

  // Needed for SeekOrigin::End
  std::optional<uint64_t> total_size;
};

/**
 * Random-access reader over a forward-only source
 *
 * Retention policy: a sliding window holding the most recently pulled
 * max_retained_bytes bytes. Seeks inside the window cost nothing. A seek
 * past the pull cursor is resolved on the next read by pulling forward;
 * pulled bytes are retained up to the limit and older ones dropped. A seek
 * before the window start fails with ErrorKind::Unsupported unless the
 * reader was built with a SourceFactory, in which case the source is
 * reopened at the target offset. With a factory, forward seeks further than
 * max_retained_bytes past the cursor also reopen instead of pulling.
 */
class SeekableReader : public ISeekableReader {
public:
  SeekableReader(std::unique_ptr<ISource> source, SeekableReaderOptions options = {});
  SeekableReader(SourceFactory factory, SeekableReaderOptions options = {});

  SeekableReader(const SeekableReader&) = delete;
  SeekableReader& operator=(const SeekableReader&) = delete;

  Status read(uint8_t* buffer, size_t max_len, size_t& bytes_read) override;
  Status seek(int64_t offset, SeekOrigin origin, uint64_t& new_position) override;

  uint64_t position() const override {
    return position_;
  }

  // Absolute offset of the first retained byte
  uint64_t windowStart() const {
    return window_start_;
  }

  // Absolute offset one past the last pulled byte
  uint64_t windowEnd() const {
    return window_start_ + window_.size();
  }

  bool restartable() const {
    return static_cast<bool>(factory_);
  }

private:
  Status reopen(uint64_t offset);
  Status pullUntilPosition();
  void append(const Bytes& segment);

  std::unique_ptr<ISource> source_;
  SourceFactory factory_;
  SeekableReaderOptions options_;

  Bytes window_;
  uint64_t window_start_ = 0;
  uint64_t position_ = 0;
  bool eof_ = false;
};

}  // namespace io
}  // namespace ferry

#endif  // FERRY_IO_SEEKABLE_READER_HPP
