// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_IO_DECOMPRESS_HPP
#define FERRY_IO_DECOMPRESS_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "adapters.hpp"
#include "io_interfaces.hpp"

namespace arrow {
namespace util {
class Decompressor;
}  // namespace util
}  // namespace arrow

namespace ferry {
namespace io {

/**
 * Compression formats understood by DecompressSource
 */
enum class CompressAlgorithm {
  Auto,    // Detect from the leading bytes of the stream
  Gzip,    // Streaming filter (deflate with gzip wrapper)
  Zlib,    // Streaming filter (deflate with zlib wrapper)
  Zstd,    // Frame oriented
  Lz4,     // LZ4 frame format
  Bz2,     // Block oriented
  Brotli,  // No magic bytes; must be named explicitly
};

const char* compressAlgorithmToString(CompressAlgorithm algorithm);

/**
 * Parse a configuration tag ("gzip", "zstd", "auto", ...), case-insensitive
 */
std::optional<CompressAlgorithm> parseCompressAlgorithm(const std::string& tag);

/**
 * Detect the format from magic bytes. Needs up to 4 leading bytes.
 */
std::optional<CompressAlgorithm> detectCompressAlgorithm(const uint8_t* data, size_t len);

/**
 * Guess the format from a file extension (".gz", ".zst", ".bz2", ...)
 */
std::optional<CompressAlgorithm> compressAlgorithmFromPath(const std::string& path);

enum class DecompressState { Idle, Decoding, Finished, Failed };

/**
 * Decoded pull-source over an encoded one
 *
 * State machine:
 *   Idle     -> Decoding  on first pull
 *   Decoding -> Decoding  while encoded input remains and the decoder has not ended
 *   Decoding -> Finished  when the decoder reports end-of-stream
 *   any      -> Failed    on a decode or source error; terminal, every later
 *                         pull returns the same error
 *
 * Input that ends before the decoder reports end-of-stream is a decode
 * failure. Bytes after the end of the first stream are ignored.
 */
class DecompressSource : public ISource {
public:
  /**
   * Build a decoder for a known algorithm (or Auto)
   *
   * @param encoded Encoded source, consumed once
   * @param algorithm Format, or Auto to detect on first pull
   * @param out Set to the decoder on success
   * @param segment_size Initial size of decoded segments
   * @return Config failure if the codec is not available in this build
   */
  static Status create(
    std::unique_ptr<ISource> encoded, CompressAlgorithm algorithm,
    std::unique_ptr<DecompressSource>& out, size_t segment_size = kDefaultSegmentSize
  );

  /**
   * Build a decoder from a configuration tag
   *
   * @return Config failure for an unknown tag, before any byte is pulled
   */
  static Status create(
    std::unique_ptr<ISource> encoded, const std::string& tag,
    std::unique_ptr<DecompressSource>& out, size_t segment_size = kDefaultSegmentSize
  );

  ~DecompressSource() override;

  DecompressSource(const DecompressSource&) = delete;
  DecompressSource& operator=(const DecompressSource&) = delete;

  Status next(Bytes& segment) override;

  DecompressState state() const {
    return state_;
  }

  // Resolved algorithm; Auto until detection has run
  CompressAlgorithm algorithm() const {
    return algorithm_;
  }

  uint64_t bytesIn() const {
    return bytes_in_;
  }

  uint64_t bytesOut() const {
    return bytes_out_;
  }

private:
  DecompressSource(std::unique_ptr<ISource> encoded, CompressAlgorithm algorithm, size_t segment_size);

  Status initDecoder(CompressAlgorithm algorithm);
  Status detect();
  Status pullInput();
  Status fail(const Status& status);

  std::unique_ptr<ISource> encoded_;
  CompressAlgorithm algorithm_;
  std::shared_ptr<arrow::util::Decompressor> decompressor_;

  DecompressState state_ = DecompressState::Idle;
  Status failure_ = Status::Success();

  Bytes input_;
  size_t input_pos_ = 0;
  bool input_eof_ = false;
  bool need_more_output_ = false;

  Bytes output_;
  size_t output_capacity_;

  uint64_t bytes_in_ = 0;
  uint64_t bytes_out_ = 0;
};

}  // namespace io
}  // namespace ferry

#endif  // FERRY_IO_DECOMPRESS_HPP
