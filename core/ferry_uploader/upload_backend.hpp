// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_UPLOAD_BACKEND_HPP
#define FERRY_UPLOAD_BACKEND_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include <io_status.hpp>

#include "http_client.hpp"

namespace ferry {
namespace uploader {

using io::ErrorKind;
using io::Status;

/**
 * Remote capability the chunked upload writer drives
 *
 * Every method returns a failed Status only when no response was obtained
 * (transport failure, IO kind). A response with any HTTP status is reported
 * through `response` and judged by the caller.
 *
 * Implementations must be safe to call from several writers on different
 * threads.
 */
class IUploadBackend {
public:
  virtual ~IUploadBackend() = default;

  /**
   * Single-shot upload of a whole payload
   *
   * @param path Target path in the remote namespace
   * @param size Declared content length, if known
   * @param content_type Declared content type, if any
   */
  virtual Status put(
    const std::string& path, std::optional<uint64_t> size,
    const std::optional<std::string>& content_type, const uint8_t* data, size_t len,
    HttpResponse& response
  ) = 0;

  /**
   * JSON POST, used to create upload sessions
   */
  virtual Status post(const std::string& url, const std::string& body, HttpResponse& response) = 0;

  /**
   * Upload one chunk to an open session
   *
   * @param start First byte offset of the chunk (inclusive)
   * @param end Last byte offset of the chunk (inclusive)
   * @param total Declared length of the whole payload
   */
  virtual Status sessionUpload(
    const std::string& session_url, uint64_t start, uint64_t end, uint64_t total,
    const uint8_t* data, size_t len, HttpResponse& response
  ) = 0;

  /**
   * Endpoint that creates an upload session for `path`
   */
  virtual std::string sessionCreationUrl(const std::string& path) const = 0;

  /**
   * Turn a non-success response into a Backend failure
   */
  virtual Status parseError(const HttpResponse& response) const = 0;
};

}  // namespace uploader
}  // namespace ferry

#endif  // FERRY_UPLOAD_BACKEND_HPP
