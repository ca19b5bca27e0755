// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * @file test_file_sink.cpp
 * @brief Unit tests for file and console sink creation and record formatting
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "ferry_console_sink.hpp"
#include "ferry_file_sink.hpp"
#include "ferry_log_init.hpp"
#include "ferry_log_macros.hpp"

namespace fs = std::filesystem;

using namespace ferry::logging;

// ============================================================================
// File Sink Config Tests
// ============================================================================

TEST(FileSinkConfigTest, DefaultValues) {
  FileSinkConfig config;

  EXPECT_EQ(config.directory, "/var/log/ferry");
  EXPECT_EQ(config.file_pattern, "ferry_%Y%m%d_%H%M%S.log");
  EXPECT_EQ(config.rotation_size_mb, 100u);
  EXPECT_TRUE(config.rotate_at_midnight);
  EXPECT_EQ(config.max_files, 10);
  EXPECT_TRUE(config.format_json);
}

// ============================================================================
// File Sink Tests
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_dir_ = fs::temp_directory_path() /
                ("ferry_file_sink_test_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    fs::create_directories(test_dir_);

    if (is_logging_initialized()) {
      shutdown_logging();
    }
  }

  void TearDown() override {
    if (is_logging_initialized()) {
      shutdown_logging();
    }
    if (fs::exists(test_dir_)) {
      fs::remove_all(test_dir_);
    }
  }

  std::string read_all_logs() {
    std::string content;
    for (const auto& entry : fs::directory_iterator(test_dir_)) {
      std::ifstream in(entry.path());
      std::stringstream ss;
      ss << in.rdbuf();
      content += ss.str();
    }
    return content;
  }

  fs::path test_dir_;
};

TEST_F(FileSinkTest, CreateJsonAndText) {
  FileSinkConfig config;
  config.directory = test_dir_.string();

  config.format_json = true;
  EXPECT_NE(create_file_sink(config, severity_level::info), nullptr);

  config.format_json = false;
  EXPECT_NE(create_file_sink(config, severity_level::debug), nullptr);
}

TEST_F(FileSinkTest, UnusableDirectoryFallsBackToTmp) {
  fs::path blocker = test_dir_ / "not_a_dir";
  std::ofstream(blocker.string()) << "x";

  EXPECT_EQ(resolve_log_directory((blocker / "logs").string()), "/tmp");
  EXPECT_EQ(resolve_log_directory(test_dir_.string()), test_dir_.string());
}

TEST_F(FileSinkTest, CreatesMissingDirectory) {
  FileSinkConfig config;
  config.directory = (test_dir_ / "nested" / "logs").string();

  auto sink = create_file_sink(config, severity_level::info);
  ASSERT_NE(sink, nullptr);
  EXPECT_TRUE(fs::exists(test_dir_ / "nested" / "logs"));
}

TEST_F(FileSinkTest, JsonRecordCarriesTransferContext) {
  LoggingConfig config;
  config.console_enabled = false;
  config.file_enabled = true;
  config.file_level = severity_level::info;
  config.file_config.directory = test_dir_.string();
  config.file_config.file_pattern = "ctx_%N.log";
  config.file_config.format_json = true;
  init_logging(config);

  {
    FERRY_LOG_SCOPED_CONTEXT("/docs/report.pdf", "0badc0de");
    FERRY_LOG_INFO("upload complete" << kv("bytes", 1000000));
  }
  shutdown_logging();

  std::string content = read_all_logs();
  EXPECT_NE(content.find("\"level\":\"INFO\""), std::string::npos) << content;
  EXPECT_NE(content.find("upload complete bytes=1000000"), std::string::npos) << content;
  EXPECT_NE(content.find("\"path\":\"/docs/report.pdf\""), std::string::npos) << content;
  EXPECT_NE(content.find("\"session\":\"0badc0de\""), std::string::npos) << content;
  EXPECT_NE(content.find("\"component\":\"ferry\""), std::string::npos) << content;
}

TEST_F(FileSinkTest, JsonRecordEscapesMessage) {
  LoggingConfig config;
  config.console_enabled = false;
  config.file_enabled = true;
  config.file_level = severity_level::info;
  config.file_config.directory = test_dir_.string();
  config.file_config.file_pattern = "escape_%N.log";
  config.file_config.format_json = true;
  init_logging(config);

  FERRY_LOG_WARN("name \"a\\b\"\nnext" << kv("tab", "x\ty"));
  shutdown_logging();

  std::string content = read_all_logs();
  EXPECT_NE(content.find("\"level\":\"WARN\""), std::string::npos) << content;
  EXPECT_NE(content.find("name \\\"a\\\\b\\\"\\nnext"), std::string::npos) << content;
  EXPECT_NE(content.find("tab=\\\"x\\ty\\\""), std::string::npos) << content;
  // One record, one line
  EXPECT_EQ(std::count(content.begin(), content.end(), '\n'), 1) << content;
}

TEST_F(FileSinkTest, TextRecordFilteredBySeverity) {
  LoggingConfig config;
  config.console_enabled = false;
  config.file_enabled = true;
  config.file_level = severity_level::warn;
  config.file_config.directory = test_dir_.string();
  config.file_config.file_pattern = "text_%N.log";
  config.file_config.format_json = false;
  init_logging(config);

  FERRY_LOG_INFO("below threshold");
  FERRY_LOG_ERROR("chunk rejected" << kv("status", 507));
  shutdown_logging();

  std::string content = read_all_logs();
  EXPECT_EQ(content.find("below threshold"), std::string::npos) << content;
  EXPECT_NE(content.find("[ERROR] [ferry] chunk rejected"), std::string::npos) << content;
  EXPECT_NE(content.find("chunk rejected status=507"), std::string::npos) << content;
}

// ============================================================================
// Console Sink Tests
// ============================================================================

TEST(ConsoleSinkTest, CreateWithAndWithoutColors) {
  EXPECT_NE(create_console_sink(severity_level::info, true), nullptr);
  EXPECT_NE(create_console_sink(severity_level::debug, false), nullptr);
}

TEST(ConsoleSinkTest, AddAndRemoveCustomSink) {
  auto sink = create_console_sink(severity_level::warn, false);
  add_sink(sink);
  FERRY_LOG_WARN("through custom sink");
  sink->flush();
  remove_sink(sink);
  sink->stop();
  SUCCEED();
}
