// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_BEAST_HTTP_CLIENT_HPP
#define FERRY_BEAST_HTTP_CLIENT_HPP

#include <chrono>
#include <string>

#include "http_client.hpp"

namespace ferry {
namespace uploader {

/**
 * HTTP/1.1 client on Boost.Beast
 *
 * Each request opens its own connection on a private io_context, so one
 * client may be shared by writers on different threads.
 */
class BeastHttpClient : public IHttpClient {
public:
  struct Config {
    // Deadline for the whole exchange, from name resolution to the last response byte
    std::chrono::seconds request_timeout{300};
    std::string user_agent = "ferry/1.0";
    bool verify_peer = true;  // Verify the server certificate and host name
  };

  BeastHttpClient();
  explicit BeastHttpClient(const Config& config);
  ~BeastHttpClient() override;

  io::Status send(const HttpRequest& request, HttpResponse& response) override;

  /**
   * Split http(s)://host(:port)/target
   *
   * @return false if the URL is not an absolute http or https URL
   */
  static bool parse_url(
    const std::string& url, std::string& host, std::string& port, std::string& target, bool& use_ssl
  );

  const Config& config() const {
    return config_;
  }

private:
  Config config_;
};

}  // namespace uploader
}  // namespace ferry

#endif  // FERRY_BEAST_HTTP_CLIENT_HPP
