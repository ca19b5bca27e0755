// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_CHUNKED_UPLOAD_WRITER_HPP
#define FERRY_CHUNKED_UPLOAD_WRITER_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <io_interfaces.hpp>

#include "chunk_plan.hpp"
#include "upload_backend.hpp"

namespace ferry {
namespace uploader {

/**
 * Upload tuning options
 */
struct UploadConfig {
  // Payloads up to and including this size go out in one request
  uint64_t max_simple_size = 4 * 1024 * 1024;

  // Chunk length for session uploads; a non-zero multiple of kChunkAlignment
  uint64_t chunk_size_factor = kChunkAlignment;

  // "replace", "rename" or "fail"
  std::string conflict_behavior = "replace";
};

/**
 * Check an UploadConfig
 *
 * @param error Set to a description of the first invalid field
 * @return true if the configuration is usable
 */
bool validateUploadConfig(const UploadConfig& config, std::string& error);

/**
 * Target of one logical write
 */
struct WriteContext {
  std::string path;
  std::optional<std::string> content_type;
  std::optional<uint64_t> total_size;
};

/**
 * Server-side state of a chunked upload
 */
struct UploadSession {
  std::string upload_url;
  std::string expiration;  // ISO 8601, as returned by the server
};

/**
 * Last path segment, or nullopt for an empty path or a container path
 */
std::optional<std::string> fileNameOf(const std::string& path);

/**
 * Body of the createUploadSession request for `file_name`
 */
std::string buildSessionRequestBody(const std::string& file_name, const std::string& conflict_behavior);

/**
 * Parse a createUploadSession response body
 *
 * @return Backend failure if the body is not JSON or lacks uploadUrl
 */
Status parseSessionResponse(const std::string& body, UploadSession& session);

/**
 * Writes one payload to a remote path, choosing single-shot or chunked
 * upload by size
 *
 * Payloads of at most max_simple_size bytes are sent with a single put.
 * Larger payloads open an upload session and send ascending byte ranges of
 * chunk_size_factor bytes, strictly one after another; the final accepted
 * range commits the file. Any rejected request fails the whole write and no
 * further request is made.
 *
 * A writer serves exactly one write attempt. It is not thread-safe; use one
 * writer per file and per thread.
 *
 * Example:
 *   auto backend = std::make_shared<OneDriveBackend>(onedrive_config, http_client);
 *   ChunkedUploadWriter writer(backend, WriteContext{"/docs/report.pdf", {}, {}});
 *   Status status = writer.write(payload.data(), payload.size());
 */
class ChunkedUploadWriter {
public:
  /**
   * @throws std::invalid_argument if backend is null or config is invalid
   */
  ChunkedUploadWriter(
    std::shared_ptr<IUploadBackend> backend, WriteContext context, UploadConfig config = UploadConfig()
  );

  ChunkedUploadWriter(const ChunkedUploadWriter&) = delete;
  ChunkedUploadWriter& operator=(const ChunkedUploadWriter&) = delete;

  /**
   * Upload a payload held in memory
   *
   * @return Config failure for a path without a file name, IO failure when
   *         the context declares a different size, Backend failure for a
   *         rejected request
   */
  Status write(const uint8_t* data, size_t len);
  Status write(const io::Bytes& payload);

  /**
   * Upload a payload pulled from a source
   *
   * With a declared total size the payload is streamed chunk by chunk and
   * never held whole in memory. Without one the source is drained first.
   *
   * @return IO failure if the source yields fewer or more bytes than declared
   */
  Status writeFrom(std::unique_ptr<io::ISource> source);

  /**
   * Give up on the write. Later writes fail; a session already opened on the
   * server is left to expire.
   */
  Status abort();

  /**
   * Finish the write. The last accepted request already committed the file.
   */
  Status close();

  const WriteContext& context() const {
    return context_;
  }

  const UploadConfig& config() const {
    return config_;
  }

  bool aborted() const {
    return aborted_;
  }

private:
  Status checkUsable() const;
  Status begin(uint64_t len);
  Status writeSimple(const uint8_t* data, size_t len);
  Status writeChunked(io::IReader& reader, uint64_t total);
  Status createSession(const std::string& file_name, UploadSession& session);
  Status readExact(io::IReader& reader, uint8_t* buffer, size_t len, uint64_t offset, uint64_t total);
  Status expectEnd(io::IReader& reader, uint64_t total);

  std::shared_ptr<IUploadBackend> backend_;
  WriteContext context_;
  UploadConfig config_;
  std::string file_name_;
  bool used_ = false;
  bool aborted_ = false;
  bool closed_ = false;
};

}  // namespace uploader
}  // namespace ferry

#endif  // FERRY_CHUNKED_UPLOAD_WRITER_HPP
