// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "adapters.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

namespace ferry {
namespace io {

Status pump(ISource& source, ISink& sink, uint64_t* bytes_pumped) {
  uint64_t total = 0;
  Bytes segment;

  while (true) {
    Status status = source.next(segment);
    if (!status.ok()) {
      if (bytes_pumped) *bytes_pumped = total;
      return status;
    }
    if (segment.empty()) {
      break;
    }

    status = sink.push(segment);
    if (!status.ok()) {
      if (bytes_pumped) *bytes_pumped = total;
      return status;
    }
    total += segment.size();
  }

  if (bytes_pumped) *bytes_pumped = total;
  return sink.finish();
}

Status readFull(IReader& reader, uint8_t* buffer, size_t len, size_t& bytes_read) {
  bytes_read = 0;
  while (bytes_read < len) {
    size_t n = 0;
    Status status = reader.read(buffer + bytes_read, len - bytes_read, n);
    if (!status.ok()) {
      return status;
    }
    if (n == 0) {
      break;
    }
    bytes_read += n;
  }
  return Status::Success();
}

// =============================================================================
// SinkWriter
// =============================================================================

SinkWriter::SinkWriter(std::unique_ptr<ISink> sink)
    : sink_(std::move(sink)) {}

Status SinkWriter::write(const uint8_t* data, size_t len) {
  if (closed_) {
    return Status::Failure(ErrorKind::Unsupported, "write after close");
  }
  if (len == 0) {
    return Status::Success();
  }
  return sink_->push(Bytes(data, data + len));
}

Status SinkWriter::close() {
  if (closed_) {
    return Status::Success();
  }
  // Marked closed even if finish fails: end-of-data is signalled at most once
  closed_ = true;
  return sink_->finish();
}

// =============================================================================
// SourceReader
// =============================================================================

SourceReader::SourceReader(std::unique_ptr<ISource> source)
    : source_(std::move(source)) {}

Status SourceReader::read(uint8_t* buffer, size_t max_len, size_t& bytes_read) {
  bytes_read = 0;

  while (bytes_read < max_len) {
    if (pending_pos_ == pending_.size()) {
      if (eof_) {
        break;
      }
      pending_.clear();
      pending_pos_ = 0;
      Status status = source_->next(pending_);
      if (!status.ok()) {
        // Bytes already copied stay valid; bytes_read reports them
        return status;
      }
      if (pending_.empty()) {
        eof_ = true;
        break;
      }
    }

    size_t n = std::min(max_len - bytes_read, pending_.size() - pending_pos_);
    std::memcpy(buffer + bytes_read, pending_.data() + pending_pos_, n);
    pending_pos_ += n;
    bytes_read += n;
  }

  return Status::Success();
}

// =============================================================================
// ReaderSource
// =============================================================================

ReaderSource::ReaderSource(std::unique_ptr<IReader> reader, size_t segment_size)
    : reader_(std::move(reader))
    , segment_size_(segment_size == 0 ? kDefaultSegmentSize : segment_size) {}

Status ReaderSource::next(Bytes& segment) {
  segment.clear();
  if (done_) {
    return Status::Success();
  }

  segment.resize(segment_size_);
  size_t n = 0;
  Status status = reader_->read(segment.data(), segment_size_, n);
  if (!status.ok()) {
    segment.clear();
    return status;
  }

  segment.resize(n);
  if (n == 0) {
    done_ = true;
  }
  return Status::Success();
}

// =============================================================================
// MemorySource / MemorySink
// =============================================================================

MemorySource::MemorySource(Bytes data, size_t segment_size)
    : data_(std::move(data))
    , segment_size_(segment_size == 0 ? kDefaultSegmentSize : segment_size) {}

Status MemorySource::next(Bytes& segment) {
  size_t n = std::min(segment_size_, data_.size() - offset_);
  segment.assign(data_.begin() + offset_, data_.begin() + offset_ + n);
  offset_ += n;
  return Status::Success();
}

Status MemorySink::push(const Bytes& segment) {
  if (finished_) {
    return Status::Failure(ErrorKind::Unsupported, "push after finish");
  }
  data_.insert(data_.end(), segment.begin(), segment.end());
  ++segment_count_;
  return Status::Success();
}

Status MemorySink::finish() {
  if (finished_) {
    return Status::Failure(ErrorKind::Unsupported, "sink already finished");
  }
  finished_ = true;
  return Status::Success();
}

// =============================================================================
// FileReader
// =============================================================================

FileReader::FileReader(const std::string& path, uint64_t size)
    : path_(path)
    , size_(size)
    , file_(path, std::ios::binary) {}

Status FileReader::open(const std::string& path, std::unique_ptr<FileReader>& reader) {
  std::ifstream probe(path, std::ios::binary | std::ios::ate);
  if (!probe) {
    return Status::Failure(ErrorKind::IO, "Cannot open local file: " + path);
  }
  auto pos = probe.tellg();
  if (pos < 0) {
    return Status::Failure(ErrorKind::IO, "Cannot determine file size: " + path);
  }
  probe.close();

  std::unique_ptr<FileReader> opened(new FileReader(path, static_cast<uint64_t>(pos)));
  if (!opened->file_) {
    return Status::Failure(ErrorKind::IO, "Cannot open local file: " + path);
  }
  reader = std::move(opened);
  return Status::Success();
}

Status FileReader::read(uint8_t* buffer, size_t max_len, size_t& bytes_read) {
  bytes_read = 0;
  if (max_len == 0 || file_.eof()) {
    return Status::Success();
  }

  file_.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(max_len));
  bytes_read = static_cast<size_t>(file_.gcount());
  if (file_.bad()) {
    return Status::Failure(ErrorKind::IO, "Failed to read file: " + path_);
  }
  return Status::Success();
}

}  // namespace io
}  // namespace ferry
