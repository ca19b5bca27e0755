// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#define FERRY_LOG_COMPONENT "onedrive"

#include "onedrive_backend.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <stdexcept>
#include <utility>

#include <ferry_log_macros.hpp>

namespace ferry {
namespace uploader {

using logging::kv;

namespace {

constexpr size_t kMaxErrorBodyInMessage = 512;

bool isUnreserved(unsigned char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' ||
         c == '.' || c == '_' || c == '~';
}

}  // namespace

OneDriveBackend::OneDriveBackend(OneDriveConfig config, std::shared_ptr<IHttpClient> client)
    : config_(std::move(config))
    , client_(std::move(client)) {
  if (!client_) {
    throw std::invalid_argument("OneDriveBackend requires an HTTP client");
  }
  if (config_.base_url.empty()) {
    throw std::invalid_argument("onedrive.base_url must not be empty");
  }
  while (config_.base_url.size() > 1 && config_.base_url.back() == '/') {
    config_.base_url.pop_back();
  }
  if (config_.access_token.empty()) {
    const char* token = std::getenv("FERRY_ONEDRIVE_TOKEN");
    if (token != nullptr) {
      config_.access_token = token;
    }
  }
  if (config_.access_token.empty()) {
    FERRY_LOG_WARN("no OneDrive access token configured; requests will be unauthenticated");
  }
}

std::string OneDriveBackend::percentEncodePath(const std::string& path) {
  static const char kHex[] = "0123456789ABCDEF";

  std::string encoded;
  encoded.reserve(path.size() + 1);
  if (path.empty() || path.front() != '/') {
    encoded.push_back('/');
  }
  for (unsigned char c : path) {
    if (c == '/' || isUnreserved(c)) {
      encoded.push_back(static_cast<char>(c));
    } else {
      encoded.push_back('%');
      encoded.push_back(kHex[c >> 4]);
      encoded.push_back(kHex[c & 0x0f]);
    }
  }
  return encoded;
}

bool OneDriveBackend::isRetryableStatus(int status_code) {
  return status_code == 408 || status_code == 429 || (status_code >= 500 && status_code <= 599);
}

std::string OneDriveBackend::itemUrl(const std::string& path, const std::string& action) const {
  return config_.base_url + "/drive/root:" + percentEncodePath(path) + ":/" + action;
}

std::string OneDriveBackend::contentUrl(const std::string& path) const {
  return itemUrl(path, "content");
}

std::string OneDriveBackend::sessionCreationUrl(const std::string& path) const {
  return itemUrl(path, "createUploadSession");
}

void OneDriveBackend::authorize(HttpRequest& request) const {
  if (!config_.access_token.empty()) {
    request.headers["Authorization"] = "Bearer " + config_.access_token;
  }
}

Status OneDriveBackend::put(
  const std::string& path, std::optional<uint64_t> size,
  const std::optional<std::string>& content_type, const uint8_t* data, size_t len,
  HttpResponse& response
) {
  HttpRequest request;
  request.method = "PUT";
  request.url = contentUrl(path);
  authorize(request);
  request.headers["Content-Type"] = content_type ? *content_type : "application/octet-stream";
  if (size) {
    request.headers["Content-Length"] = std::to_string(*size);
  }
  request.body.assign(reinterpret_cast<const char*>(data), len);
  return client_->send(request, response);
}

Status OneDriveBackend::post(const std::string& url, const std::string& body, HttpResponse& response) {
  HttpRequest request;
  request.method = "POST";
  request.url = url;
  authorize(request);
  request.headers["Content-Type"] = "application/json";
  request.body = body;
  return client_->send(request, response);
}

Status OneDriveBackend::sessionUpload(
  const std::string& session_url, uint64_t start, uint64_t end, uint64_t total,
  const uint8_t* data, size_t len, HttpResponse& response
) {
  HttpRequest request;
  request.method = "PUT";
  request.url = session_url;
  request.headers["Content-Length"] = std::to_string(len);
  request.headers["Content-Range"] =
    "bytes " + std::to_string(start) + "-" + std::to_string(end) + "/" + std::to_string(total);
  request.body.assign(reinterpret_cast<const char*>(data), len);
  return client_->send(request, response);
}

Status OneDriveBackend::parseError(const HttpResponse& response) const {
  std::string code;
  std::string message;

  try {
    nlohmann::json json = nlohmann::json::parse(response.body);
    if (json.is_object() && json.contains("error") && json["error"].is_object()) {
      const auto& error = json["error"];
      code = error.value("code", std::string());
      message = error.value("message", std::string());
    }
  } catch (const nlohmann::json::exception&) {
    // Not a Graph error document; report the raw body below
  }

  if (message.empty()) {
    message = response.body.substr(0, kMaxErrorBodyInMessage);
  }

  std::string full = "OneDrive returned status " + std::to_string(response.status_code);
  if (!code.empty()) {
    full += " (" + code + ")";
  }
  if (!message.empty()) {
    full += ": " + message;
  }
  return Status::BackendFailure(
    response.status_code, full, code, isRetryableStatus(response.status_code)
  );
}

}  // namespace uploader
}  // namespace ferry
