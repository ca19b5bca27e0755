// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "config_parser.hpp"

#include <fstream>

#include <decompress.hpp>

namespace ferry {
namespace config {

// ============================================================================
// ConfigParser Implementation
// ============================================================================

bool ConfigParser::load_from_file(const std::string& path, FerryConfig& config) {
  std::ifstream file(path);
  if (!file.good()) {
    last_error_ = "Config file not found or not readable: " + path;
    return false;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(path);
    return load_from_string(YAML::Dump(yaml), config);
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML file: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::load_from_string(const std::string& yaml_content, FerryConfig& config) {
  try {
    YAML::Node node = YAML::Load(yaml_content);

    if (node["upload"] && !parse_upload(node["upload"], config.upload)) {
      return false;
    }
    if (node["onedrive"] && !parse_onedrive(node["onedrive"], config.onedrive)) {
      return false;
    }
    if (node["http"] && !parse_http(node["http"], config.http)) {
      return false;
    }
    if (node["io"] && !parse_io(node["io"], config.io)) {
      return false;
    }
    if (node["logging"] && !parse_logging(node["logging"], config.logging)) {
      return false;
    }

    return true;
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML content: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::parse_upload(const YAML::Node& node, uploader::UploadConfig& upload) {
  if (!node.IsMap()) {
    last_error_ = "upload must be a map";
    return false;
  }
  if (node["max_simple_size"]) {
    upload.max_simple_size = node["max_simple_size"].as<uint64_t>();
  }
  if (node["chunk_size_factor"]) {
    upload.chunk_size_factor = node["chunk_size_factor"].as<uint64_t>();
  }
  if (node["conflict_behavior"]) {
    upload.conflict_behavior = node["conflict_behavior"].as<std::string>();
  }
  return true;
}

bool ConfigParser::parse_onedrive(const YAML::Node& node, uploader::OneDriveConfig& onedrive) {
  if (!node.IsMap()) {
    last_error_ = "onedrive must be a map";
    return false;
  }
  if (node["base_url"]) {
    onedrive.base_url = node["base_url"].as<std::string>();
  }
  if (node["access_token"]) {
    onedrive.access_token = node["access_token"].as<std::string>();
  }
  return true;
}

bool ConfigParser::parse_http(const YAML::Node& node, HttpConfig& http) {
  if (!node.IsMap()) {
    last_error_ = "http must be a map";
    return false;
  }
  if (node["request_timeout_sec"]) {
    http.request_timeout_sec = node["request_timeout_sec"].as<int>();
  }
  if (node["verify_ssl"]) {
    http.verify_ssl = node["verify_ssl"].as<bool>();
  }
  if (node["user_agent"]) {
    http.user_agent = node["user_agent"].as<std::string>();
  }
  return true;
}

bool ConfigParser::parse_io(const YAML::Node& node, IoConfig& io) {
  if (!node.IsMap()) {
    last_error_ = "io must be a map";
    return false;
  }
  if (node["segment_size"]) {
    io.segment_size = node["segment_size"].as<uint64_t>();
  }
  if (node["decompress"]) {
    io.decompress = node["decompress"].as<std::string>();
  }
  return true;
}

bool ConfigParser::parse_logging(const YAML::Node& node, LoggingConfig& logging) {
  // Parse console section
  if (node["console"]) {
    const auto& console = node["console"];
    if (console["enabled"]) {
      logging.console_enabled = console["enabled"].as<bool>();
    }
    if (console["colors"]) {
      logging.console_colors = console["colors"].as<bool>();
    }
    if (console["level"]) {
      logging.console_level = console["level"].as<std::string>();
    }
  }

  // Parse file section
  if (node["file"]) {
    const auto& file = node["file"];
    if (file["enabled"]) {
      logging.file_enabled = file["enabled"].as<bool>();
    }
    if (file["level"]) {
      logging.file_level = file["level"].as<std::string>();
    }
    if (file["directory"]) {
      logging.file_directory = file["directory"].as<std::string>();
    }
    if (file["pattern"]) {
      logging.file_pattern = file["pattern"].as<std::string>();
    }
    if (file["format"]) {
      logging.file_format = file["format"].as<std::string>();
    }
    if (file["rotation_size_mb"]) {
      logging.rotation_size_mb = file["rotation_size_mb"].as<uint64_t>();
    }
    if (file["max_files"]) {
      logging.max_files = file["max_files"].as<int>();
    }
    if (file["rotate_at_midnight"]) {
      logging.rotate_at_midnight = file["rotate_at_midnight"].as<bool>();
    }
  }

  return true;
}

bool ConfigParser::validate(const FerryConfig& config, std::string& error_msg) {
  if (!uploader::validateUploadConfig(config.upload, error_msg)) {
    return false;
  }

  if (config.onedrive.base_url.find("http://") != 0 &&
      config.onedrive.base_url.find("https://") != 0) {
    error_msg = "Invalid onedrive.base_url - must start with http:// or https://";
    return false;
  }

  if (config.http.request_timeout_sec <= 0) {
    error_msg = "Invalid http.request_timeout_sec - must be > 0";
    return false;
  }

  if (config.io.segment_size == 0) {
    error_msg = "Invalid io.segment_size - must be > 0";
    return false;
  }
  if (config.io.decompress != "none" && !io::parseCompressAlgorithm(config.io.decompress)) {
    error_msg = "Invalid io.decompress - unknown compression algorithm '" + config.io.decompress + "'";
    return false;
  }

  if (!logging::parse_severity_level(config.logging.console_level)) {
    error_msg = "Invalid logging.console.level '" + config.logging.console_level + "'";
    return false;
  }
  if (!logging::parse_severity_level(config.logging.file_level)) {
    error_msg = "Invalid logging.file.level '" + config.logging.file_level + "'";
    return false;
  }
  if (config.logging.file_format != "json" && config.logging.file_format != "text") {
    error_msg = "Invalid logging.file.format - must be 'json' or 'text'";
    return false;
  }

  return true;
}

void convert_logging_config(const LoggingConfig& yaml_config, logging::LoggingConfig& log_config) {
  // Console settings
  log_config.console_enabled = yaml_config.console_enabled;
  log_config.console_colors = yaml_config.console_colors;

  if (auto level = logging::parse_severity_level(yaml_config.console_level)) {
    log_config.console_level = *level;
  }

  // File settings
  log_config.file_enabled = yaml_config.file_enabled;

  if (auto level = logging::parse_severity_level(yaml_config.file_level)) {
    log_config.file_level = *level;
  }

  log_config.file_config.directory = yaml_config.file_directory;
  log_config.file_config.file_pattern = yaml_config.file_pattern;
  log_config.file_config.format_json = (yaml_config.file_format == "json");
  log_config.file_config.rotation_size_mb = yaml_config.rotation_size_mb;
  log_config.file_config.max_files = yaml_config.max_files;
  log_config.file_config.rotate_at_midnight = yaml_config.rotate_at_midnight;
}

}  // namespace config
}  // namespace ferry
