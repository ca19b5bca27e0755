// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_UPLOADER_MOCKS_HPP
#define FERRY_UPLOADER_MOCKS_HPP

#include <gmock/gmock.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "http_client.hpp"
#include "upload_backend.hpp"

namespace ferry {
namespace uploader {
namespace test {

/**
 * Mock implementation of IHttpClient for testing
 */
class MockHttpClient : public IHttpClient {
public:
  MOCK_METHOD(io::Status, send, (const HttpRequest& request, HttpResponse& response), (override));
};

/**
 * One call observed by RecordingBackend
 */
struct RecordedCall {
  std::string kind;  // "put", "post" or "chunk"
  std::string target;
  std::string body;
  uint64_t start = 0;
  uint64_t end = 0;
  uint64_t total = 0;
  std::optional<uint64_t> size;
  std::optional<std::string> content_type;
};

/**
 * In-memory upload backend
 *
 * Records every call in order. Responses default to the protocol's success
 * codes and can be overridden per call index.
 */
class RecordingBackend : public IUploadBackend {
public:
  static constexpr const char* kSessionUrl = "https://upload.example.test/session/42";

  Status put(
    const std::string& path, std::optional<uint64_t> size,
    const std::optional<std::string>& content_type, const uint8_t* data, size_t len,
    HttpResponse& response
  ) override {
    RecordedCall call;
    call.kind = "put";
    call.target = path;
    call.body.assign(reinterpret_cast<const char*>(data), len);
    call.size = size;
    call.content_type = content_type;
    return respond(call, 201, "{\"id\":\"item\"}", response);
  }

  Status post(const std::string& url, const std::string& body, HttpResponse& response) override {
    RecordedCall call;
    call.kind = "post";
    call.target = url;
    call.body = body;
    return respond(
      call, 200,
      std::string("{\"uploadUrl\":\"") + kSessionUrl +
        "\",\"expirationDateTime\":\"2026-10-18T00:00:00Z\"}",
      response
    );
  }

  Status sessionUpload(
    const std::string& session_url, uint64_t start, uint64_t end, uint64_t total,
    const uint8_t* data, size_t len, HttpResponse& response
  ) override {
    RecordedCall call;
    call.kind = "chunk";
    call.target = session_url;
    call.body.assign(reinterpret_cast<const char*>(data), len);
    call.start = start;
    call.end = end;
    call.total = total;
    int status = end + 1 == total ? 201 : 202;
    return respond(call, status, "{}", response);
  }

  std::string sessionCreationUrl(const std::string& path) const override {
    return "https://drive.example.test/root:" + path + ":/createUploadSession";
  }

  Status parseError(const HttpResponse& response) const override {
    return Status::BackendFailure(
      response.status_code, "rejected with " + std::to_string(response.status_code), "scripted",
      response.status_code >= 500
    );
  }

  // Answer call number `index` (0-based) with a custom response
  void scriptResponse(size_t index, int status_code, const std::string& body = "{}") {
    scripted_[index] = HttpResponse{status_code, {}, body};
  }

  // Fail call number `index` without a response
  void scriptTransportFailure(size_t index) {
    transport_failures_.push_back(index);
  }

  const std::vector<RecordedCall>& calls() const {
    return calls_;
  }

  // Concatenation of every chunk body, in call order
  std::string uploadedChunks() const {
    std::string out;
    for (const auto& call : calls_) {
      if (call.kind == "chunk") {
        out += call.body;
      }
    }
    return out;
  }

private:
  Status respond(
    const RecordedCall& call, int default_status, const std::string& default_body,
    HttpResponse& response
  ) {
    size_t index = calls_.size();
    calls_.push_back(call);

    for (size_t failing : transport_failures_) {
      if (failing == index) {
        return Status::Failure(ErrorKind::IO, "connection reset by peer");
      }
    }
    auto it = scripted_.find(index);
    if (it != scripted_.end()) {
      response = it->second;
    } else {
      response = HttpResponse{default_status, {}, default_body};
    }
    return Status::Success();
  }

  std::vector<RecordedCall> calls_;
  std::map<size_t, HttpResponse> scripted_;
  std::vector<size_t> transport_failures_;
};

}  // namespace test
}  // namespace uploader
}  // namespace ferry

#endif  // FERRY_UPLOADER_MOCKS_HPP
