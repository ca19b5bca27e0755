// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#define FERRY_LOG_COMPONENT "decompress"

#include "decompress.hpp"

#include <arrow/result.h>
#include <arrow/status.h>
#include <arrow/util/compression.h>

#include <algorithm>
#include <cctype>
#include <utility>

#include <ferry_log_macros.hpp>

namespace ferry {
namespace io {

using logging::kv;

namespace {

// Enough for every magic number we check
constexpr size_t kDetectPrefixBytes = 4;

// Decoded segments never grow beyond this while searching for output space
constexpr size_t kMaxSegmentSize = 64 * 1024 * 1024;

std::string toLower(const std::string& s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

bool endsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

arrow::Compression::type toArrowCompression(CompressAlgorithm algorithm) {
  switch (algorithm) {
    case CompressAlgorithm::Gzip:
    case CompressAlgorithm::Zlib:
      // Arrow's gzip decompressor detects the gzip or zlib wrapper from the header
      return arrow::Compression::GZIP;
    case CompressAlgorithm::Zstd:
      return arrow::Compression::ZSTD;
    case CompressAlgorithm::Lz4:
      return arrow::Compression::LZ4_FRAME;
    case CompressAlgorithm::Bz2:
      return arrow::Compression::BZ2;
    case CompressAlgorithm::Brotli:
      return arrow::Compression::BROTLI;
    default:
      return arrow::Compression::UNCOMPRESSED;
  }
}

}  // namespace

const char* compressAlgorithmToString(CompressAlgorithm algorithm) {
  switch (algorithm) {
    case CompressAlgorithm::Auto:
      return "auto";
    case CompressAlgorithm::Gzip:
      return "gzip";
    case CompressAlgorithm::Zlib:
      return "zlib";
    case CompressAlgorithm::Zstd:
      return "zstd";
    case CompressAlgorithm::Lz4:
      return "lz4";
    case CompressAlgorithm::Bz2:
      return "bz2";
    case CompressAlgorithm::Brotli:
      return "brotli";
    default:
      return "unknown";
  }
}

std::optional<CompressAlgorithm> parseCompressAlgorithm(const std::string& tag) {
  std::string t = toLower(tag);
  if (t == "auto") return CompressAlgorithm::Auto;
  if (t == "gzip" || t == "gz") return CompressAlgorithm::Gzip;
  if (t == "zlib" || t == "deflate") return CompressAlgorithm::Zlib;
  if (t == "zstd" || t == "zst") return CompressAlgorithm::Zstd;
  if (t == "lz4") return CompressAlgorithm::Lz4;
  if (t == "bz2" || t == "bzip2") return CompressAlgorithm::Bz2;
  if (t == "brotli" || t == "br") return CompressAlgorithm::Brotli;
  return std::nullopt;
}

std::optional<CompressAlgorithm> detectCompressAlgorithm(const uint8_t* data, size_t len) {
  if (len >= 2 && data[0] == 0x1f && data[1] == 0x8b) {
    return CompressAlgorithm::Gzip;
  }
  if (len >= 4 && data[0] == 0x28 && data[1] == 0xb5 && data[2] == 0x2f && data[3] == 0xfd) {
    return CompressAlgorithm::Zstd;
  }
  if (len >= 4 && data[0] == 0x04 && data[1] == 0x22 && data[2] == 0x4d && data[3] == 0x18) {
    return CompressAlgorithm::Lz4;
  }
  if (len >= 3 && data[0] == 'B' && data[1] == 'Z' && data[2] == 'h') {
    return CompressAlgorithm::Bz2;
  }
  // zlib: CM=8 (deflate), CINFO<=7, header checksum divisible by 31
  if (len >= 2 && (data[0] & 0x0f) == 0x08 && (data[0] >> 4) <= 7 &&
      ((static_cast<unsigned>(data[0]) << 8) | data[1]) % 31 == 0) {
    return CompressAlgorithm::Zlib;
  }
  return std::nullopt;
}

std::optional<CompressAlgorithm> compressAlgorithmFromPath(const std::string& path) {
  std::string p = toLower(path);
  if (endsWith(p, ".gz") || endsWith(p, ".gzip")) return CompressAlgorithm::Gzip;
  if (endsWith(p, ".zz") || endsWith(p, ".zlib")) return CompressAlgorithm::Zlib;
  if (endsWith(p, ".zst") || endsWith(p, ".zstd")) return CompressAlgorithm::Zstd;
  if (endsWith(p, ".lz4")) return CompressAlgorithm::Lz4;
  if (endsWith(p, ".bz2")) return CompressAlgorithm::Bz2;
  if (endsWith(p, ".br")) return CompressAlgorithm::Brotli;
  return std::nullopt;
}

// =============================================================================
// DecompressSource
// =============================================================================

DecompressSource::DecompressSource(
  std::unique_ptr<ISource> encoded, CompressAlgorithm algorithm, size_t segment_size
)
    : encoded_(std::move(encoded))
    , algorithm_(algorithm)
    , output_capacity_(segment_size == 0 ? kDefaultSegmentSize : segment_size) {}

DecompressSource::~DecompressSource() = default;

Status DecompressSource::create(
  std::unique_ptr<ISource> encoded, CompressAlgorithm algorithm,
  std::unique_ptr<DecompressSource>& out, size_t segment_size
) {
  if (!encoded) {
    return Status::Failure(ErrorKind::Config, "decompress source requires an encoded source");
  }

  std::unique_ptr<DecompressSource> source(
    new DecompressSource(std::move(encoded), algorithm, segment_size)
  );
  if (algorithm != CompressAlgorithm::Auto) {
    Status status = source->initDecoder(algorithm);
    if (!status.ok()) {
      return status;
    }
  }
  out = std::move(source);
  return Status::Success();
}

Status DecompressSource::create(
  std::unique_ptr<ISource> encoded, const std::string& tag, std::unique_ptr<DecompressSource>& out,
  size_t segment_size
) {
  auto algorithm = parseCompressAlgorithm(tag);
  if (!algorithm) {
    return Status::Failure(ErrorKind::Config, "unknown compression algorithm: " + tag);
  }
  return create(std::move(encoded), *algorithm, out, segment_size);
}

Status DecompressSource::initDecoder(CompressAlgorithm algorithm) {
  arrow::Compression::type type = toArrowCompression(algorithm);
  if (type == arrow::Compression::UNCOMPRESSED || !arrow::util::Codec::IsAvailable(type)) {
    return Status::Failure(
      ErrorKind::Config,
      std::string("compression codec not available in this build: ") +
        compressAlgorithmToString(algorithm)
    );
  }

  auto codec_result = arrow::util::Codec::Create(type);
  if (!codec_result.ok()) {
    return Status::Failure(
      ErrorKind::Config, "failed to create codec: " + codec_result.status().ToString()
    );
  }
  std::unique_ptr<arrow::util::Codec> codec = std::move(codec_result.ValueOrDie());

  auto decompressor_result = codec->MakeDecompressor();
  if (!decompressor_result.ok()) {
    return Status::Failure(
      ErrorKind::Config, "failed to create decompressor: " + decompressor_result.status().ToString()
    );
  }
  decompressor_ = decompressor_result.ValueOrDie();
  algorithm_ = algorithm;
  return Status::Success();
}

Status DecompressSource::pullInput() {
  Bytes segment;
  Status status = encoded_->next(segment);
  if (!status.ok()) {
    return status;
  }
  if (segment.empty()) {
    input_eof_ = true;
    return Status::Success();
  }
  bytes_in_ += segment.size();
  if (input_pos_ == input_.size()) {
    input_ = std::move(segment);
    input_pos_ = 0;
  } else {
    input_.insert(input_.end(), segment.begin(), segment.end());
  }
  return Status::Success();
}

Status DecompressSource::detect() {
  while (!input_eof_ && input_.size() - input_pos_ < kDetectPrefixBytes) {
    Status status = pullInput();
    if (!status.ok()) {
      return status;
    }
  }

  auto detected = detectCompressAlgorithm(input_.data() + input_pos_, input_.size() - input_pos_);
  if (!detected) {
    return Status::Failure(ErrorKind::Config, "unable to detect compression format from stream header");
  }
  FERRY_LOG_DEBUG("detected compression format" << kv("algorithm", compressAlgorithmToString(*detected)));
  return initDecoder(*detected);
}

Status DecompressSource::fail(const Status& status) {
  state_ = DecompressState::Failed;
  failure_ = status;
  FERRY_LOG_WARN(
    "decompression failed" << kv("algorithm", compressAlgorithmToString(algorithm_))
                           << kv("bytes_in", bytes_in_) << kv("error", status.error_message)
  );
  return status;
}

Status DecompressSource::next(Bytes& segment) {
  segment.clear();

  switch (state_) {
    case DecompressState::Finished:
      return Status::Success();
    case DecompressState::Failed:
      return failure_;
    case DecompressState::Idle: {
      state_ = DecompressState::Decoding;
      if (!decompressor_) {
        Status status = detect();
        if (!status.ok()) {
          return fail(status);
        }
      }
      break;
    }
    case DecompressState::Decoding:
      break;
  }

  while (true) {
    if (!need_more_output_ && input_pos_ == input_.size()) {
      if (input_eof_) {
        return fail(Status::Failure(
          ErrorKind::IO, "compressed stream ended before the decoder reached end of stream"
        ));
      }
      Status status = pullInput();
      if (!status.ok()) {
        return fail(status);
      }
      continue;
    }

    output_.resize(output_capacity_);
    auto result = decompressor_->Decompress(
      static_cast<int64_t>(input_.size() - input_pos_), input_.data() + input_pos_,
      static_cast<int64_t>(output_capacity_), output_.data()
    );
    if (!result.ok()) {
      return fail(Status::Failure(ErrorKind::IO, "decode error: " + result.status().ToString()));
    }
    arrow::util::Decompressor::DecompressResult step = result.ValueOrDie();
    input_pos_ += static_cast<size_t>(step.bytes_read);
    need_more_output_ = step.need_more_output;

    if (decompressor_->IsFinished()) {
      state_ = DecompressState::Finished;
    }

    if (step.bytes_written > 0) {
      bytes_out_ += static_cast<uint64_t>(step.bytes_written);
      segment.assign(output_.begin(), output_.begin() + step.bytes_written);
      return Status::Success();
    }
    if (state_ == DecompressState::Finished) {
      FERRY_LOG_DEBUG(
        "decompression finished" << kv("bytes_in", bytes_in_) << kv("bytes_out", bytes_out_)
      );
      return Status::Success();
    }

    if (step.bytes_read > 0) {
      continue;
    }
    if (input_pos_ == input_.size()) {
      // Nothing buffered inside the decoder either; go fetch more input
      need_more_output_ = false;
      continue;
    }
    if (step.need_more_output && output_capacity_ < kMaxSegmentSize) {
      output_capacity_ = std::min(output_capacity_ * 2, kMaxSegmentSize);
      continue;
    }
    return fail(Status::Failure(ErrorKind::IO, "decoder made no progress on input"));
  }
}

}  // namespace io
}  // namespace ferry
