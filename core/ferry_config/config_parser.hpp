// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_CONFIG_PARSER_HPP
#define FERRY_CONFIG_PARSER_HPP

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <string>

#include <chunked_upload_writer.hpp>
#include <ferry_log_init.hpp>
#include <onedrive_backend.hpp>

namespace ferry {
namespace config {

/**
 * HTTP transport settings
 */
struct HttpConfig {
  int request_timeout_sec = 300;
  bool verify_ssl = true;
  std::string user_agent = "ferry/1.0";
};

/**
 * Stream wrapper settings
 */
struct IoConfig {
  uint64_t segment_size = 64 * 1024;
  std::string decompress = "none";  // "none", "auto" or an algorithm tag
};

/**
 * Logging settings as written in YAML; see convert_logging_config
 */
struct LoggingConfig {
  bool console_enabled = true;
  bool console_colors = true;
  std::string console_level = "info";

  bool file_enabled = false;
  std::string file_level = "debug";
  std::string file_directory = "/var/log/ferry";
  std::string file_pattern = "ferry_%Y%m%d_%H%M%S.log";
  std::string file_format = "json";
  uint64_t rotation_size_mb = 100;
  int max_files = 10;
  bool rotate_at_midnight = true;
};

/**
 * Complete ferry configuration
 */
struct FerryConfig {
  uploader::UploadConfig upload;
  uploader::OneDriveConfig onedrive;
  HttpConfig http;
  IoConfig io;
  LoggingConfig logging;
};

/**
 * YAML configuration loader
 *
 * Missing sections and keys keep their defaults. Parse failures return
 * false and leave a description in last_error().
 */
class ConfigParser {
public:
  bool load_from_file(const std::string& path, FerryConfig& config);
  bool load_from_string(const std::string& yaml_content, FerryConfig& config);

  /**
   * Check value ranges across all sections
   *
   * @param error_msg Set to the first problem found
   */
  static bool validate(const FerryConfig& config, std::string& error_msg);

  const std::string& last_error() const {
    return last_error_;
  }

private:
  bool parse_upload(const YAML::Node& node, uploader::UploadConfig& upload);
  bool parse_onedrive(const YAML::Node& node, uploader::OneDriveConfig& onedrive);
  bool parse_http(const YAML::Node& node, HttpConfig& http);
  bool parse_io(const YAML::Node& node, IoConfig& io);
  bool parse_logging(const YAML::Node& node, LoggingConfig& logging);

  std::string last_error_;
};

/**
 * Map the YAML logging section onto the logging library's configuration
 */
void convert_logging_config(const LoggingConfig& yaml_config, logging::LoggingConfig& log_config);

}  // namespace config
}  // namespace ferry

#endif  // FERRY_CONFIG_PARSER_HPP
