// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "seekable_reader.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <string>
#include <utility>

namespace ferry {
namespace io {

SeekableReader::SeekableReader(std::unique_ptr<ISource> source, SeekableReaderOptions options)
    : source_(std::move(source))
    , options_(options) {}

SeekableReader::SeekableReader(SourceFactory factory, SeekableReaderOptions options)
    : factory_(std::move(factory))
    , options_(options) {}

Status SeekableReader::reopen(uint64_t offset) {
  std::unique_ptr<ISource> fresh;
  Status status = factory_(offset, fresh);
  if (!status.ok()) {
    return status;
  }
  if (!fresh) {
    return Status::Failure(
      ErrorKind::IO, "source factory returned no source for offset " + std::to_string(offset)
    );
  }
  source_ = std::move(fresh);
  window_.clear();
  window_start_ = offset;
  eof_ = false;
  return Status::Success();
}

void SeekableReader::append(const Bytes& segment) {
  window_.insert(window_.end(), segment.begin(), segment.end());

  if (window_.size() <= options_.max_retained_bytes) {
    return;
  }
  // Never drop bytes at or after the read position
  uint64_t excess = window_.size() - options_.max_retained_bytes;
  uint64_t behind = position_ > window_start_ ? position_ - window_start_ : 0;
  uint64_t drop = std::min(excess, behind);
  if (drop > 0) {
    window_.erase(window_.begin(), window_.begin() + static_cast<std::ptrdiff_t>(drop));
    window_start_ += drop;
  }
}

Status SeekableReader::pullUntilPosition() {
  Bytes segment;
  while (!eof_ && position_ >= windowEnd()) {
    Status status = source_->next(segment);
    if (!status.ok()) {
      return status;
    }
    if (segment.empty()) {
      eof_ = true;
      break;
    }
    append(segment);
  }
  return Status::Success();
}

Status SeekableReader::read(uint8_t* buffer, size_t max_len, size_t& bytes_read) {
  bytes_read = 0;
  if (max_len == 0) {
    return Status::Success();
  }

  if (!source_ || position_ < window_start_) {
    if (!factory_) {
      return Status::Failure(ErrorKind::Unsupported, "no source to read from");
    }
    Status status = reopen(position_);
    if (!status.ok()) {
      return status;
    }
  }

  if (position_ >= windowEnd()) {
    Status status = pullUntilPosition();
    if (!status.ok()) {
      return status;
    }
    if (position_ >= windowEnd()) {
      return Status::Success();  // end-of-data
    }
  }

  uint64_t offset = position_ - window_start_;
  size_t n = static_cast<size_t>(std::min<uint64_t>(max_len, window_.size() - offset));
  std::memcpy(buffer, window_.data() + offset, n);
  position_ += n;
  bytes_read = n;
  return Status::Success();
}

Status SeekableReader::seek(int64_t offset, SeekOrigin origin, uint64_t& new_position) {
  constexpr uint64_t kMaxPosition = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());

  uint64_t base = 0;
  switch (origin) {
    case SeekOrigin::Begin:
      base = 0;
      break;
    case SeekOrigin::Current:
      base = position_;
      break;
    case SeekOrigin::End:
      if (!options_.total_size) {
        return Status::Failure(ErrorKind::Unsupported, "seek from end requires a known size");
      }
      base = *options_.total_size;
      break;
  }

  // Targets are computed in uint64_t and must stay within [0, INT64_MAX]
  uint64_t absolute = 0;
  if (offset < 0) {
    uint64_t back = static_cast<uint64_t>(-(offset + 1)) + 1;
    if (back > base) {
      return Status::Failure(
        ErrorKind::Unsupported,
        "seek to negative position: " + std::to_string(base) + " + (" + std::to_string(offset) + ")"
      );
    }
    absolute = base - back;
    if (absolute > kMaxPosition) {
      return Status::Failure(
        ErrorKind::Unsupported, "seek target " + std::to_string(absolute) + " is out of range"
      );
    }
  } else {
    uint64_t forward = static_cast<uint64_t>(offset);
    if (base > kMaxPosition || forward > kMaxPosition - base) {
      return Status::Failure(
        ErrorKind::Unsupported,
        "seek overflows the addressable range: " + std::to_string(base) + " + " +
          std::to_string(offset)
      );
    }
    absolute = base + forward;
  }

  if (absolute < window_start_ && !factory_) {
    return Status::Failure(
      ErrorKind::Unsupported,
      "seek to " + std::to_string(absolute) + " is before the retained window starting at " +
        std::to_string(window_start_)
    );
  }

  if (factory_ && source_ && absolute > windowEnd() &&
      absolute - windowEnd() > options_.max_retained_bytes) {
    // Cheaper to reopen than to pull and discard
    source_.reset();
  }

  position_ = absolute;
  new_position = absolute;
  return Status::Success();
}

}  // namespace io
}  // namespace ferry
