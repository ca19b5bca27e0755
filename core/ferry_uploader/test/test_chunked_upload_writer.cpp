// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for ChunkedUploadWriter against a recording backend
 */

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <memory>
#include <stdexcept>
#include <string>

#include <adapters.hpp>

#include "chunked_upload_writer.hpp"
#include "uploader_mocks.hpp"

using namespace ferry::uploader;
using namespace ferry::uploader::test;
using ferry::io::Bytes;
using ferry::io::ErrorKind;
using ferry::io::MemorySource;

namespace {

constexpr uint64_t kFourMiB = 4 * 1024 * 1024;

Bytes make_payload(size_t size) {
  Bytes data(size);
  for (size_t i = 0; i < size; ++i) {
    data[i] = static_cast<uint8_t>((i * 131 + 17) % 253);
  }
  return data;
}

std::string as_string(const Bytes& data) {
  return std::string(data.begin(), data.end());
}

}  // namespace

class ChunkedUploadWriterTest : public ::testing::Test {
protected:
  void SetUp() override {
    backend_ = std::make_shared<RecordingBackend>();
  }

  WriteContext context(const std::string& path = "/docs/report.bin") {
    WriteContext ctx;
    ctx.path = path;
    return ctx;
  }

  UploadConfig small_threshold() {
    UploadConfig config;
    config.max_simple_size = 500000;
    return config;
  }

  std::shared_ptr<RecordingBackend> backend_;
};

// =============================================================================
// Mode selection
// =============================================================================

TEST_F(ChunkedUploadWriterTest, PayloadAtThresholdIsSingleShot) {
  Bytes payload = make_payload(kFourMiB);
  WriteContext ctx = context();
  ctx.content_type = "application/pdf";
  ChunkedUploadWriter writer(backend_, ctx);

  Status status = writer.write(payload);
  ASSERT_TRUE(status.ok()) << status;

  ASSERT_EQ(backend_->calls().size(), 1u);
  const RecordedCall& call = backend_->calls()[0];
  EXPECT_EQ(call.kind, "put");
  EXPECT_EQ(call.target, "/docs/report.bin");
  EXPECT_EQ(call.body, as_string(payload));
  EXPECT_EQ(call.size, std::optional<uint64_t>(kFourMiB));
  EXPECT_EQ(call.content_type, std::optional<std::string>("application/pdf"));
}

TEST_F(ChunkedUploadWriterTest, PayloadOverThresholdIsChunked) {
  Bytes payload = make_payload(kFourMiB + 1);
  ChunkedUploadWriter writer(backend_, context());

  Status status = writer.write(payload);
  ASSERT_TRUE(status.ok()) << status;

  const auto& calls = backend_->calls();
  const size_t chunks = (kFourMiB + 1 + kChunkAlignment - 1) / kChunkAlignment;
  ASSERT_EQ(calls.size(), chunks + 1);
  EXPECT_EQ(calls[0].kind, "post");
  EXPECT_EQ(calls[0].target, backend_->sessionCreationUrl("/docs/report.bin"));
  for (size_t i = 1; i < calls.size(); ++i) {
    EXPECT_EQ(calls[i].kind, "chunk");
    EXPECT_EQ(calls[i].target, RecordingBackend::kSessionUrl);
  }
  EXPECT_EQ(calls.back().end, kFourMiB);
  EXPECT_EQ(calls.back().body.size(), 1u);
  EXPECT_EQ(backend_->uploadedChunks(), as_string(payload));
}

TEST_F(ChunkedUploadWriterTest, EmptyPayloadIsSingleShot) {
  ChunkedUploadWriter writer(backend_, context());
  ASSERT_TRUE(writer.write(Bytes{}).ok());
  ASSERT_EQ(backend_->calls().size(), 1u);
  EXPECT_EQ(backend_->calls()[0].kind, "put");
  EXPECT_TRUE(backend_->calls()[0].body.empty());
}

// =============================================================================
// Chunked protocol
// =============================================================================

TEST_F(ChunkedUploadWriterTest, OneMillionByteRanges) {
  Bytes payload = make_payload(1000000);
  ChunkedUploadWriter writer(backend_, context(), small_threshold());

  ASSERT_TRUE(writer.write(payload).ok());

  const auto& calls = backend_->calls();
  ASSERT_EQ(calls.size(), 5u);
  EXPECT_EQ(calls[1].start, 0u);
  EXPECT_EQ(calls[1].end, 327679u);
  EXPECT_EQ(calls[2].start, 327680u);
  EXPECT_EQ(calls[2].end, 655359u);
  EXPECT_EQ(calls[3].start, 655360u);
  EXPECT_EQ(calls[3].end, 983039u);
  EXPECT_EQ(calls[4].start, 983040u);
  EXPECT_EQ(calls[4].end, 999999u);
  for (size_t i = 1; i < calls.size(); ++i) {
    EXPECT_EQ(calls[i].total, 1000000u);
    EXPECT_EQ(calls[i].body.size(), calls[i].end - calls[i].start + 1);
  }
  EXPECT_EQ(calls[4].body.size(), 16960u);
}

TEST_F(ChunkedUploadWriterTest, LargerChunkFactor) {
  UploadConfig config = small_threshold();
  config.chunk_size_factor = 3 * kChunkAlignment;
  Bytes payload = make_payload(2500000);
  ChunkedUploadWriter writer(backend_, context(), config);

  ASSERT_TRUE(writer.write(payload).ok());
  // ceil(2500000 / 983040) = 3 chunks plus session creation
  ASSERT_EQ(backend_->calls().size(), 4u);
  EXPECT_EQ(backend_->calls()[1].body.size(), 983040u);
  EXPECT_EQ(backend_->uploadedChunks(), as_string(payload));
}

TEST_F(ChunkedUploadWriterTest, SessionRequestBody) {
  UploadConfig config = small_threshold();
  config.conflict_behavior = "rename";
  ChunkedUploadWriter writer(backend_, context("/a/b/data.csv"), config);

  ASSERT_TRUE(writer.write(make_payload(600000)).ok());

  nlohmann::json body = nlohmann::json::parse(backend_->calls()[0].body);
  EXPECT_EQ(body["item"]["@microsoft.graph.conflictBehavior"], "rename");
  EXPECT_EQ(body["item"]["name"], "data.csv");
}

TEST_F(ChunkedUploadWriterTest, RejectedChunkStopsUpload) {
  backend_->scriptResponse(2, 503, "{\"error\":{\"code\":\"serviceNotAvailable\"}}");
  ChunkedUploadWriter writer(backend_, context(), small_threshold());

  Status status = writer.write(make_payload(1000000));
  EXPECT_FALSE(status.ok());
  EXPECT_EQ(status.kind, ErrorKind::Backend);
  EXPECT_EQ(status.http_status, 503);
  EXPECT_TRUE(status.is_retryable);
  EXPECT_EQ(backend_->calls().size(), 3u);
}

TEST_F(ChunkedUploadWriterTest, TransportFailureStopsUpload) {
  backend_->scriptTransportFailure(1);
  ChunkedUploadWriter writer(backend_, context(), small_threshold());

  Status status = writer.write(make_payload(1000000));
  EXPECT_EQ(status.kind, ErrorKind::IO);
  EXPECT_EQ(backend_->calls().size(), 2u);
}

TEST_F(ChunkedUploadWriterTest, SessionRejected) {
  backend_->scriptResponse(0, 403, "{\"error\":{\"code\":\"accessDenied\"}}");
  ChunkedUploadWriter writer(backend_, context(), small_threshold());

  Status status = writer.write(make_payload(600000));
  EXPECT_EQ(status.kind, ErrorKind::Backend);
  EXPECT_EQ(status.http_status, 403);
  ASSERT_EQ(backend_->calls().size(), 1u);
  EXPECT_EQ(backend_->calls()[0].kind, "post");
}

TEST_F(ChunkedUploadWriterTest, SessionWithoutUploadUrl) {
  backend_->scriptResponse(0, 200, "{\"expirationDateTime\":\"2026-10-18T00:00:00Z\"}");
  ChunkedUploadWriter writer(backend_, context(), small_threshold());

  Status status = writer.write(make_payload(600000));
  EXPECT_EQ(status.kind, ErrorKind::Backend);
  EXPECT_EQ(status.http_status, 200);
  EXPECT_EQ(backend_->calls().size(), 1u);
}

TEST_F(ChunkedUploadWriterTest, SingleShotRejected) {
  backend_->scriptResponse(0, 409, "{\"error\":{\"code\":\"nameAlreadyExists\"}}");
  ChunkedUploadWriter writer(backend_, context());

  Status status = writer.write(make_payload(100));
  EXPECT_EQ(status.kind, ErrorKind::Backend);
  EXPECT_EQ(status.http_status, 409);
  EXPECT_FALSE(status.is_retryable);
}

// =============================================================================
// Argument and lifecycle checks
// =============================================================================

TEST_F(ChunkedUploadWriterTest, PathWithoutFileName) {
  for (const std::string path : {"", "dir/", "/"}) {
    auto backend = std::make_shared<RecordingBackend>();
    ChunkedUploadWriter writer(backend, context(path));
    Status status = writer.write(make_payload(10));
    EXPECT_EQ(status.kind, ErrorKind::Config) << "path '" << path << "'";
    EXPECT_TRUE(backend->calls().empty());
  }
}

TEST_F(ChunkedUploadWriterTest, InvalidConstruction) {
  EXPECT_THROW(ChunkedUploadWriter(nullptr, context()), std::invalid_argument);

  UploadConfig config;
  config.chunk_size_factor = 1000;
  EXPECT_THROW(ChunkedUploadWriter(backend_, context(), config), std::invalid_argument);

  config = UploadConfig();
  config.chunk_size_factor = 0;
  EXPECT_THROW(ChunkedUploadWriter(backend_, context(), config), std::invalid_argument);

  config = UploadConfig();
  config.chunk_size_factor = kMaxChunkSize + kChunkAlignment;
  EXPECT_THROW(ChunkedUploadWriter(backend_, context(), config), std::invalid_argument);

  config = UploadConfig();
  config.conflict_behavior = "keep";
  EXPECT_THROW(ChunkedUploadWriter(backend_, context(), config), std::invalid_argument);

  config = UploadConfig();
  config.max_simple_size = 0;
  EXPECT_THROW(ChunkedUploadWriter(backend_, context(), config), std::invalid_argument);
}

TEST_F(ChunkedUploadWriterTest, WriteAfterAbort) {
  ChunkedUploadWriter writer(backend_, context());
  ASSERT_TRUE(writer.abort().ok());
  EXPECT_TRUE(writer.aborted());

  Status status = writer.write(make_payload(10));
  EXPECT_EQ(status.kind, ErrorKind::Unsupported);
  EXPECT_TRUE(backend_->calls().empty());
}

TEST_F(ChunkedUploadWriterTest, WriterIsSingleUse) {
  ChunkedUploadWriter writer(backend_, context());
  ASSERT_TRUE(writer.write(make_payload(10)).ok());

  Status status = writer.write(make_payload(10));
  EXPECT_EQ(status.kind, ErrorKind::Unsupported);
  EXPECT_EQ(backend_->calls().size(), 1u);
}

TEST_F(ChunkedUploadWriterTest, WriteAfterClose) {
  ChunkedUploadWriter writer(backend_, context());
  ASSERT_TRUE(writer.close().ok());
  EXPECT_EQ(writer.write(make_payload(10)).kind, ErrorKind::Unsupported);
  EXPECT_TRUE(backend_->calls().empty());
}

TEST_F(ChunkedUploadWriterTest, DeclaredSizeMismatch) {
  WriteContext ctx = context();
  ctx.total_size = 11;
  ChunkedUploadWriter writer(backend_, ctx);

  EXPECT_EQ(writer.write(make_payload(10)).kind, ErrorKind::IO);
  EXPECT_TRUE(backend_->calls().empty());
}

// =============================================================================
// writeFrom
// =============================================================================

TEST_F(ChunkedUploadWriterTest, WriteFromStreamsWithDeclaredSize) {
  Bytes payload = make_payload(1000000);
  WriteContext ctx = context();
  ctx.total_size = payload.size();
  ChunkedUploadWriter writer(backend_, ctx, small_threshold());

  Status status = writer.writeFrom(std::make_unique<MemorySource>(payload, 4096));
  ASSERT_TRUE(status.ok()) << status;
  EXPECT_EQ(backend_->calls().size(), 5u);
  EXPECT_EQ(backend_->uploadedChunks(), as_string(payload));
}

TEST_F(ChunkedUploadWriterTest, WriteFromSmallDeclaredSize) {
  Bytes payload = make_payload(3000);
  WriteContext ctx = context();
  ctx.total_size = payload.size();
  ChunkedUploadWriter writer(backend_, ctx);

  ASSERT_TRUE(writer.writeFrom(std::make_unique<MemorySource>(payload, 1000)).ok());
  ASSERT_EQ(backend_->calls().size(), 1u);
  EXPECT_EQ(backend_->calls()[0].body, as_string(payload));
}

TEST_F(ChunkedUploadWriterTest, WriteFromUnknownSize) {
  Bytes payload = make_payload(700000);
  ChunkedUploadWriter writer(backend_, context(), small_threshold());

  ASSERT_TRUE(writer.writeFrom(std::make_unique<MemorySource>(payload, 65536)).ok());
  EXPECT_EQ(backend_->calls().size(), 4u);
  EXPECT_EQ(backend_->uploadedChunks(), as_string(payload));
}

TEST_F(ChunkedUploadWriterTest, WriteFromShortSource) {
  WriteContext ctx = context();
  ctx.total_size = 1000000;
  ChunkedUploadWriter writer(backend_, ctx, small_threshold());

  Status status = writer.writeFrom(std::make_unique<MemorySource>(make_payload(900000), 65536));
  EXPECT_EQ(status.kind, ErrorKind::IO);
  // Session plus the two chunks that could be filled
  EXPECT_EQ(backend_->calls().size(), 3u);
}

TEST_F(ChunkedUploadWriterTest, WriteFromLongSource) {
  WriteContext ctx = context();
  ctx.total_size = 1000;
  ChunkedUploadWriter writer(backend_, ctx);

  Status status = writer.writeFrom(std::make_unique<MemorySource>(make_payload(1001), 100));
  EXPECT_EQ(status.kind, ErrorKind::IO);
  EXPECT_TRUE(backend_->calls().empty());
}

TEST_F(ChunkedUploadWriterTest, WriteFromLongSourceChunked) {
  WriteContext ctx = context();
  ctx.total_size = 600000;
  ChunkedUploadWriter writer(backend_, ctx, small_threshold());

  Status status = writer.writeFrom(std::make_unique<MemorySource>(make_payload(600001), 65536));
  EXPECT_EQ(status.kind, ErrorKind::IO);
  // The final chunk is never sent, so the file is not committed
  EXPECT_EQ(backend_->calls().size(), 2u);
}

TEST_F(ChunkedUploadWriterTest, WriteFromNullSource) {
  ChunkedUploadWriter writer(backend_, context());
  EXPECT_EQ(writer.writeFrom(nullptr).kind, ErrorKind::Config);
}

// =============================================================================
// Helpers
// =============================================================================

TEST(UploadHelpersTest, FileNameOf) {
  EXPECT_EQ(fileNameOf("/a/b/c.txt"), std::optional<std::string>("c.txt"));
  EXPECT_EQ(fileNameOf("c.txt"), std::optional<std::string>("c.txt"));
  EXPECT_FALSE(fileNameOf("").has_value());
  EXPECT_FALSE(fileNameOf("/a/").has_value());
}

TEST(UploadHelpersTest, ParseSessionResponse) {
  UploadSession session;
  ASSERT_TRUE(parseSessionResponse(
                "{\"uploadUrl\":\"https://up/1\",\"expirationDateTime\":\"2026-10-18T00:00:00Z\"}",
                session
  )
                .ok());
  EXPECT_EQ(session.upload_url, "https://up/1");
  EXPECT_EQ(session.expiration, "2026-10-18T00:00:00Z");

  EXPECT_EQ(parseSessionResponse("not json", session).kind, ErrorKind::Backend);
  EXPECT_EQ(parseSessionResponse("{\"uploadUrl\":5}", session).kind, ErrorKind::Backend);
  EXPECT_EQ(parseSessionResponse("[]", session).kind, ErrorKind::Backend);
}

TEST(UploadHelpersTest, ValidateUploadConfig) {
  std::string error;
  EXPECT_TRUE(validateUploadConfig(UploadConfig(), error));

  UploadConfig config;
  config.chunk_size_factor = 327681;
  EXPECT_FALSE(validateUploadConfig(config, error));
  EXPECT_NE(error.find("chunk_size_factor"), std::string::npos);
}
