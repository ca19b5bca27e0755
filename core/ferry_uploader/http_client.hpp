// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_HTTP_CLIENT_HPP
#define FERRY_HTTP_CLIENT_HPP

#include <map>
#include <string>

#include <io_status.hpp>

namespace ferry {
namespace uploader {

/**
 * Outgoing HTTP request
 */
struct HttpRequest {
  std::string method;  // "GET", "PUT", "POST", ...
  std::string url;     // Absolute http:// or https:// URL
  std::map<std::string, std::string> headers;
  std::string body;
};

/**
 * Response of one HTTP request
 */
struct HttpResponse {
  int status_code = 0;
  std::map<std::string, std::string> headers;
  std::string body;
};

/**
 * Blocking HTTP transport
 */
class IHttpClient {
public:
  virtual ~IHttpClient() = default;

  /**
   * Perform one request
   *
   * @return IO failure when no response was received (bad URL, DNS,
   *         connect, TLS, timeout); any received status is a success here
   */
  virtual io::Status send(const HttpRequest& request, HttpResponse& response) = 0;
};

}  // namespace uploader
}  // namespace ferry

#endif  // FERRY_HTTP_CLIENT_HPP
