// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_ONEDRIVE_BACKEND_HPP
#define FERRY_ONEDRIVE_BACKEND_HPP

#include <memory>
#include <string>

#include "http_client.hpp"
#include "upload_backend.hpp"

namespace ferry {
namespace uploader {

/**
 * Microsoft Graph connection options
 */
struct OneDriveConfig {
  std::string base_url = "https://graph.microsoft.com/v1.0/me";

  // OAuth bearer token. If empty, read from FERRY_ONEDRIVE_TOKEN.
  std::string access_token;
};

/**
 * Upload backend for OneDrive through Microsoft Graph
 *
 * - put:           PUT  {base}/drive/root:{path}:/content
 * - sessions:      POST {base}/drive/root:{path}:/createUploadSession
 * - session chunk: PUT  {uploadUrl} with Content-Range; the URL is
 *                  pre-authorized, so no bearer token is sent
 */
class OneDriveBackend : public IUploadBackend {
public:
  /**
   * @throws std::invalid_argument if client is null or base_url is empty
   */
  OneDriveBackend(OneDriveConfig config, std::shared_ptr<IHttpClient> client);

  Status put(
    const std::string& path, std::optional<uint64_t> size,
    const std::optional<std::string>& content_type, const uint8_t* data, size_t len,
    HttpResponse& response
  ) override;

  Status post(const std::string& url, const std::string& body, HttpResponse& response) override;

  Status sessionUpload(
    const std::string& session_url, uint64_t start, uint64_t end, uint64_t total,
    const uint8_t* data, size_t len, HttpResponse& response
  ) override;

  std::string sessionCreationUrl(const std::string& path) const override;

  Status parseError(const HttpResponse& response) const override;

  std::string contentUrl(const std::string& path) const;

  /**
   * Percent-encode each path segment, keeping '/' separators. A leading '/'
   * is added when missing.
   */
  static std::string percentEncodePath(const std::string& path);

  /**
   * 408, 429 and 5xx are transient
   */
  static bool isRetryableStatus(int status_code);

  const OneDriveConfig& config() const {
    return config_;
  }

private:
  std::string itemUrl(const std::string& path, const std::string& action) const;
  void authorize(HttpRequest& request) const;

  OneDriveConfig config_;
  std::shared_ptr<IHttpClient> client_;
};

}  // namespace uploader
}  // namespace ferry

#endif  // FERRY_ONEDRIVE_BACKEND_HPP
