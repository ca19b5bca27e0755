// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#define FERRY_LOG_COMPONENT "chunked_writer"

#include "chunked_upload_writer.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstring>
#include <functional>
#include <initializer_list>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <adapters.hpp>
#include <ferry_log_macros.hpp>

namespace ferry {
namespace uploader {

using logging::kv;

namespace {

// Reader over a caller-owned buffer, so in-memory payloads are framed by the
// same code path as streamed ones without a copy
class BufferReader : public io::IReader {
public:
  BufferReader(const uint8_t* data, size_t len)
      : data_(data)
      , len_(len) {}

  Status read(uint8_t* buffer, size_t max_len, size_t& bytes_read) override {
    bytes_read = std::min(max_len, len_ - offset_);
    if (bytes_read > 0) {
      std::memcpy(buffer, data_ + offset_, bytes_read);
      offset_ += bytes_read;
    }
    return Status::Success();
  }

private:
  const uint8_t* data_;
  size_t len_;
  size_t offset_ = 0;
};

bool isAccepted(int status_code, std::initializer_list<int> accepted) {
  return std::find(accepted.begin(), accepted.end(), status_code) != accepted.end();
}

// Short label for log context; the upload URL itself carries credentials
std::string sessionLabel(const UploadSession& session) {
  std::ostringstream oss;
  oss << std::hex << std::setw(8) << std::setfill('0')
      << (std::hash<std::string>{}(session.upload_url) & 0xffffffffu);
  return oss.str();
}

}  // namespace

bool validateUploadConfig(const UploadConfig& config, std::string& error) {
  if (config.max_simple_size == 0) {
    error = "upload.max_simple_size must be greater than 0";
    return false;
  }
  if (config.chunk_size_factor == 0 || config.chunk_size_factor % kChunkAlignment != 0) {
    error = "upload.chunk_size_factor must be a non-zero multiple of " + std::to_string(kChunkAlignment);
    return false;
  }
  if (config.chunk_size_factor > kMaxChunkSize) {
    error = "upload.chunk_size_factor must not exceed " + std::to_string(kMaxChunkSize);
    return false;
  }
  if (config.conflict_behavior != "replace" && config.conflict_behavior != "rename" &&
      config.conflict_behavior != "fail") {
    error = "upload.conflict_behavior must be one of replace, rename, fail (got '" +
            config.conflict_behavior + "')";
    return false;
  }
  return true;
}

std::optional<std::string> fileNameOf(const std::string& path) {
  if (path.empty() || path.back() == '/') {
    return std::nullopt;
  }
  size_t pos = path.rfind('/');
  if (pos == std::string::npos) {
    return path;
  }
  return path.substr(pos + 1);
}

std::string buildSessionRequestBody(const std::string& file_name, const std::string& conflict_behavior) {
  nlohmann::json body = {
    {"item",
     {
       {"@odata.type", "microsoft.graph.driveItemUploadableProperties"},
       {"@microsoft.graph.conflictBehavior", conflict_behavior},
       {"name", file_name},
     }},
  };
  return body.dump();
}

Status parseSessionResponse(const std::string& body, UploadSession& session) {
  try {
    nlohmann::json json = nlohmann::json::parse(body);
    if (!json.is_object() || !json.contains("uploadUrl") || !json["uploadUrl"].is_string()) {
      return Status::BackendFailure(200, "upload session response has no uploadUrl", "", false);
    }
    session.upload_url = json["uploadUrl"].get<std::string>();
    session.expiration = json.value("expirationDateTime", std::string());
    return Status::Success();
  } catch (const nlohmann::json::exception& e) {
    return Status::BackendFailure(
      200, std::string("malformed upload session response: ") + e.what(), "", false
    );
  }
}

// =============================================================================
// ChunkedUploadWriter
// =============================================================================

ChunkedUploadWriter::ChunkedUploadWriter(
  std::shared_ptr<IUploadBackend> backend, WriteContext context, UploadConfig config
)
    : backend_(std::move(backend))
    , context_(std::move(context))
    , config_(std::move(config)) {
  if (!backend_) {
    throw std::invalid_argument("ChunkedUploadWriter requires a backend");
  }
  std::string error;
  if (!validateUploadConfig(config_, error)) {
    throw std::invalid_argument(error);
  }
}

Status ChunkedUploadWriter::checkUsable() const {
  if (aborted_) {
    return Status::Failure(io::ErrorKind::Unsupported, "write after abort: " + context_.path);
  }
  if (closed_) {
    return Status::Failure(io::ErrorKind::Unsupported, "write after close: " + context_.path);
  }
  if (used_) {
    return Status::Failure(
      io::ErrorKind::Unsupported, "writer already performed its write: " + context_.path
    );
  }
  return Status::Success();
}

Status ChunkedUploadWriter::begin(uint64_t len) {
  Status usable = checkUsable();
  if (!usable.ok()) {
    return usable;
  }
  used_ = true;

  auto file_name = fileNameOf(context_.path);
  if (!file_name) {
    return Status::Failure(
      io::ErrorKind::Config, "path has no file name to write to: '" + context_.path + "'"
    );
  }
  file_name_ = *file_name;

  if (context_.total_size && *context_.total_size != len) {
    return Status::Failure(
      io::ErrorKind::IO, "payload is " + std::to_string(len) + " bytes but " +
                           std::to_string(*context_.total_size) + " were declared"
    );
  }
  return Status::Success();
}

Status ChunkedUploadWriter::write(const io::Bytes& payload) {
  return write(payload.data(), payload.size());
}

Status ChunkedUploadWriter::write(const uint8_t* data, size_t len) {
  Status status = begin(len);
  if (!status.ok()) {
    FERRY_LOG_WARN("write rejected" << kv("path", context_.path) << kv("error", status.error_message));
    return status;
  }

  if (len <= config_.max_simple_size) {
    return writeSimple(data, len);
  }
  BufferReader reader(data, len);
  return writeChunked(reader, len);
}

Status ChunkedUploadWriter::writeFrom(std::unique_ptr<io::ISource> source) {
  if (!source) {
    return Status::Failure(io::ErrorKind::Config, "writeFrom requires a source");
  }

  if (!context_.total_size) {
    Status usable = checkUsable();
    if (!usable.ok()) {
      return usable;
    }
    // Size unknown: the threshold decision needs the whole payload
    io::MemorySink sink;
    Status status = io::pump(*source, sink);
    if (!status.ok()) {
      used_ = true;
      FERRY_LOG_ERROR("failed to read payload" << kv("path", context_.path)
                                                << kv("error", status.error_message));
      return status;
    }
    return write(sink.data());
  }

  uint64_t total = *context_.total_size;
  Status status = begin(total);
  if (!status.ok()) {
    return status;
  }

  io::SourceReader reader(std::move(source));
  if (total <= config_.max_simple_size) {
    io::Bytes payload(static_cast<size_t>(total));
    status = readExact(reader, payload.data(), payload.size(), 0, total);
    if (status.ok()) {
      status = expectEnd(reader, total);
    }
    if (!status.ok()) {
      FERRY_LOG_ERROR("failed to read payload" << kv("path", context_.path)
                                                << kv("error", status.error_message));
      return status;
    }
    return writeSimple(payload.data(), payload.size());
  }
  return writeChunked(reader, total);
}

Status ChunkedUploadWriter::abort() {
  if (!aborted_) {
    aborted_ = true;
    FERRY_LOG_DEBUG("write aborted" << kv("path", context_.path));
  }
  return Status::Success();
}

Status ChunkedUploadWriter::close() {
  closed_ = true;
  return Status::Success();
}

Status ChunkedUploadWriter::readExact(
  io::IReader& reader, uint8_t* buffer, size_t len, uint64_t offset, uint64_t total
) {
  size_t got = 0;
  Status status = io::readFull(reader, buffer, len, got);
  if (!status.ok()) {
    return status;
  }
  if (got != len) {
    return Status::Failure(
      io::ErrorKind::IO, "source ended after " + std::to_string(offset + got) + " of " +
                           std::to_string(total) + " declared bytes"
    );
  }
  return Status::Success();
}

Status ChunkedUploadWriter::expectEnd(io::IReader& reader, uint64_t total) {
  uint8_t probe = 0;
  size_t got = 0;
  Status status = reader.read(&probe, 1, got);
  if (!status.ok()) {
    return status;
  }
  if (got != 0) {
    return Status::Failure(
      io::ErrorKind::IO, "source yielded more than the " + std::to_string(total) + " declared bytes"
    );
  }
  return Status::Success();
}

Status ChunkedUploadWriter::writeSimple(const uint8_t* data, size_t len) {
  FERRY_LOG_SCOPED_CONTEXT(context_.path, "-");

  HttpResponse response;
  Status status = backend_->put(context_.path, len, context_.content_type, data, len, response);
  if (!status.ok()) {
    FERRY_LOG_ERROR("single-shot upload failed" << kv("error", status.error_message));
    return status;
  }
  if (!isAccepted(response.status_code, {201, 200})) {
    status = backend_->parseError(response);
    FERRY_LOG_ERROR(
      "single-shot upload rejected" << kv("status", response.status_code)
                                    << kv("code", status.error_code)
                                    << kv("error", status.error_message)
    );
    return status;
  }

  FERRY_LOG_INFO("upload complete" << kv("mode", "single") << kv("bytes", len));
  return Status::Success();
}

Status ChunkedUploadWriter::createSession(const std::string& file_name, UploadSession& session) {
  std::string url = backend_->sessionCreationUrl(context_.path);
  std::string body = buildSessionRequestBody(file_name, config_.conflict_behavior);

  HttpResponse response;
  Status status = backend_->post(url, body, response);
  if (!status.ok()) {
    return status;
  }
  if (response.status_code != 200) {
    return backend_->parseError(response);
  }
  return parseSessionResponse(response.body, session);
}

Status ChunkedUploadWriter::writeChunked(io::IReader& reader, uint64_t total) {
  UploadSession session;
  Status status = createSession(file_name_, session);
  if (!status.ok()) {
    FERRY_LOG_ERROR(
      "failed to create upload session" << kv("path", context_.path)
                                        << kv("status", status.http_status)
                                        << kv("error", status.error_message)
    );
    return status;
  }

  FERRY_LOG_SCOPED_CONTEXT(context_.path, sessionLabel(session));

  const uint64_t factor = config_.chunk_size_factor;
  std::vector<ChunkRange> plan = planChunks(total, factor);
  FERRY_LOG_DEBUG(
    "upload session created" << kv("expires", session.expiration) << kv("chunks", plan.size())
                             << kv("bytes", total)
  );

  io::Bytes buffer;
  uint64_t expected_start = 0;
  for (size_t i = 0; i < plan.size(); ++i) {
    const ChunkRange& chunk = plan[i];
    const bool is_last = i + 1 == plan.size();

    status = checkChunk(chunk, factor, expected_start, is_last);
    if (!status.ok()) {
      FERRY_LOG_ERROR("chunk framing violated" << kv("error", status.error_message));
      return status;
    }

    buffer.resize(static_cast<size_t>(chunk.length()));
    status = readExact(reader, buffer.data(), buffer.size(), chunk.start, total);
    if (status.ok() && is_last) {
      status = expectEnd(reader, total);
    }
    if (!status.ok()) {
      FERRY_LOG_ERROR("failed to read chunk" << kv("range", chunk.contentRange())
                                              << kv("error", status.error_message));
      return status;
    }

    HttpResponse response;
    status = backend_->sessionUpload(
      session.upload_url, chunk.start, chunk.end, total, buffer.data(), buffer.size(), response
    );
    if (!status.ok()) {
      FERRY_LOG_ERROR("chunk upload failed" << kv("range", chunk.contentRange())
                                             << kv("error", status.error_message));
      return status;
    }
    if (!isAccepted(response.status_code, {202, 201, 200})) {
      status = backend_->parseError(response);
      FERRY_LOG_ERROR(
        "chunk rejected" << kv("range", chunk.contentRange()) << kv("status", response.status_code)
                         << kv("code", status.error_code) << kv("error", status.error_message)
      );
      return status;
    }

    FERRY_LOG_DEBUG_EVERY_N(
      16, "chunk accepted" << kv("index", i) << kv("range", chunk.contentRange())
    );
    expected_start = chunk.end + 1;
  }

  FERRY_LOG_INFO("upload complete" << kv("mode", "chunked") << kv("chunks", plan.size())
                                   << kv("bytes", total));
  return Status::Success();
}

}  // namespace uploader
}  // namespace ferry
