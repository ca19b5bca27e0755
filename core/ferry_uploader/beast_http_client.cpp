// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#define FERRY_LOG_COMPONENT "http_client"

#include "beast_http_client.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <chrono>
#include <cstdint>
#include <regex>
#include <string>
#include <utility>

#include <ferry_log_macros.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = net::ip::tcp;

namespace ferry {
namespace uploader {

using io::ErrorKind;
using io::Status;
using logging::kv;

namespace {

http::request<http::string_body> build_request(
  const HttpRequest& request, http::verb verb, const std::string& host, const std::string& target,
  const std::string& user_agent
) {
  http::request<http::string_body> req{verb, target, 11};
  req.set(http::field::host, host);
  req.set(http::field::user_agent, user_agent);
  for (const auto& header : request.headers) {
    req.set(header.first, header.second);
  }
  req.body() = request.body;
  req.prepare_payload();
  return req;
}

// Error bodies and session replies are small, but do not cap them below Beast's default
constexpr std::uint64_t kMaxResponseBody = 16 * 1024 * 1024;

template <typename Handler>
void start_handshake(beast::tcp_stream&, Handler&& handler) {
  handler(beast::error_code{});
}

template <typename Handler>
void start_handshake(beast::ssl_stream<beast::tcp_stream>& stream, Handler&& handler) {
  stream.async_handshake(ssl::stream_base::client, std::forward<Handler>(handler));
}

template <typename Handler>
void close_stream(beast::tcp_stream& stream, Handler&& handler) {
  beast::error_code ec;
  stream.socket().shutdown(tcp::socket::shutdown_both, ec);
  if (ec == beast::errc::not_connected) {
    ec = {};
  }
  handler(ec);
}

template <typename Handler>
void close_stream(beast::ssl_stream<beast::tcp_stream>& stream, Handler&& handler) {
  stream.async_shutdown([handler = std::forward<Handler>(handler)](beast::error_code ec) mutable {
    // Servers commonly close without close_notify
    if (ec == net::error::eof || ec == ssl::error::stream_truncated) {
      ec = {};
    }
    handler(ec);
  });
}

/**
 * One request/response exchange driven by the io_context
 *
 * Every step is asynchronous so the stream deadline applies to connect,
 * handshake, write and read alike.
 */
template <typename Stream>
class Exchange {
public:
  Exchange(Stream& stream, http::request<http::string_body>& req)
      : stream_(stream)
      , req_(req) {
    parser_.body_limit(kMaxResponseBody);
  }

  void start(const tcp::resolver::results_type& endpoints) {
    beast::get_lowest_layer(stream_).async_connect(
      endpoints,
      [this](beast::error_code ec, const tcp::endpoint&) {
        if (ec) {
          return finish(ec, "connect");
        }
        start_handshake(stream_, [this](beast::error_code hs_ec) {
          if (hs_ec) {
            return finish(hs_ec, "handshake");
          }
          writeRequest();
        });
      }
    );
  }

  void finish(beast::error_code ec, const char* stage) {
    if (!done_) {
      done_ = true;
      ec_ = ec;
      stage_ = stage;
    }
  }

  bool done() const {
    return done_;
  }

  const beast::error_code& error() const {
    return ec_;
  }

  const char* stage() const {
    return stage_;
  }

  void collect(HttpResponse& response) const {
    const auto& res = parser_.get();
    response.status_code = static_cast<int>(res.result_int());
    response.headers.clear();
    for (const auto& field : res) {
      response.headers[std::string(field.name_string())] = std::string(field.value());
    }
    response.body = res.body();
  }

private:
  void writeRequest() {
    http::async_write(stream_, req_, [this](beast::error_code ec, std::size_t) {
      if (ec) {
        return finish(ec, "write");
      }
      http::async_read(stream_, buffer_, parser_, [this](beast::error_code read_ec, std::size_t) {
        if (read_ec) {
          return finish(read_ec, "read");
        }
        close_stream(stream_, [this](beast::error_code shutdown_ec) {
          if (shutdown_ec) {
            FERRY_LOG_DEBUG("connection shutdown warning" << kv("error", shutdown_ec.message()));
          }
          finish(beast::error_code{}, "done");
        });
      });
    });
  }

  Stream& stream_;
  http::request<http::string_body>& req_;
  beast::flat_buffer buffer_;
  http::response_parser<http::string_body> parser_;
  bool done_ = false;
  beast::error_code ec_;
  const char* stage_ = "resolve";
};

/**
 * Resolve, then run the exchange until it completes or the deadline passes
 *
 * @return empty on success, otherwise a description of the failed step
 */
template <typename Stream>
std::string run_exchange(
  net::io_context& ioc, Stream& stream, const std::string& host, const std::string& port,
  http::request<http::string_body>& req, std::chrono::seconds timeout, HttpResponse& response
) {
  Exchange<Stream> exchange(stream, req);
  tcp::resolver resolver(ioc);

  // One deadline for the whole request
  beast::get_lowest_layer(stream).expires_after(timeout);
  resolver.async_resolve(
    host, port,
    [&exchange](beast::error_code ec, tcp::resolver::results_type results) {
      if (ec) {
        return exchange.finish(ec, "resolve");
      }
      exchange.start(results);
    }
  );

  ioc.run_for(timeout);
  bool timed_out = !exchange.done();
  if (timed_out) {
    // Resolution is not covered by the stream timer; cancel and drain the handlers
    resolver.cancel();
    beast::error_code ignored;
    beast::get_lowest_layer(stream).socket().close(ignored);
    ioc.restart();
    ioc.run();
  }

  if (timed_out || exchange.error() == beast::error::timeout) {
    return std::string("request timed out after ") + std::to_string(timeout.count()) + "s (" +
           exchange.stage() + ")";
  }
  if (exchange.error()) {
    return std::string(exchange.stage()) + " failed: " + exchange.error().message();
  }
  exchange.collect(response);
  return std::string();
}

}  // namespace

BeastHttpClient::BeastHttpClient()
    : config_() {}

BeastHttpClient::BeastHttpClient(const Config& config)
    : config_(config) {}

BeastHttpClient::~BeastHttpClient() = default;

bool BeastHttpClient::parse_url(
  const std::string& url, std::string& host, std::string& port, std::string& target, bool& use_ssl
) {
  // Format: http(s)://host(:port)/target
  std::regex url_regex(R"(^(https?)://([^/:?#]+)(?::(\d+))?(.*)$)", std::regex::icase);
  std::smatch match;

  if (!std::regex_match(url, match, url_regex)) {
    return false;
  }

  std::string scheme = match[1].str();
  host = match[2].str();
  std::string port_str = match[3].str();
  target = match[4].str();

  if (target.empty()) {
    target = "/";
  } else if (target.front() != '/') {
    // Query without a path, e.g. https://host?x=1
    target = "/" + target;
  }

  use_ssl = (scheme.size() == 5);
  if (port_str.empty()) {
    port = use_ssl ? "443" : "80";
  } else {
    port = port_str;
  }

  return true;
}

Status BeastHttpClient::send(const HttpRequest& request, HttpResponse& response) {
  response = HttpResponse();

  std::string host, port, target;
  bool use_ssl = false;
  if (!parse_url(request.url, host, port, target, use_ssl)) {
    return Status::Failure(ErrorKind::IO, "invalid URL: " + request.url);
  }

  http::verb verb = http::string_to_verb(request.method);
  if (verb == http::verb::unknown) {
    return Status::Failure(ErrorKind::IO, "unsupported HTTP method: " + request.method);
  }

  auto req = build_request(request, verb, host, target, config_.user_agent);

  std::string error;
  try {
    net::io_context ioc;

    if (use_ssl) {
      ssl::context ctx(ssl::context::tls_client);
      ctx.set_default_verify_paths();
      ctx.set_verify_mode(config_.verify_peer ? ssl::verify_peer : ssl::verify_none);

      beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
      // SNI
      if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
        beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
        throw beast::system_error{ec};
      }
      if (config_.verify_peer) {
        stream.set_verify_callback(ssl::host_name_verification(host));
      }
      error = run_exchange(ioc, stream, host, port, req, config_.request_timeout, response);
    } else {
      beast::tcp_stream stream(ioc);
      error = run_exchange(ioc, stream, host, port, req, config_.request_timeout, response);
    }
  } catch (const std::exception& e) {
    error = e.what();
  }

  if (!error.empty()) {
    response = HttpResponse();
    FERRY_LOG_WARN(
      "HTTP request failed" << kv("method", request.method) << kv("host", host) << kv("error", error)
    );
    return Status::Failure(
      ErrorKind::IO, request.method + " " + host + target.substr(0, target.find('?')) + ": " + error
    );
  }

  FERRY_LOG_DEBUG(
    "HTTP exchange" << kv("method", request.method) << kv("host", host)
                    << kv("status", response.status_code) << kv("bytes_sent", request.body.size())
  );
  return Status::Success();
}

}  // namespace uploader
}  // namespace ferry
