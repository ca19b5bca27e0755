// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "ferry_log_init.hpp"

#include <boost/log/core.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

#include "ferry_log_macros.hpp"

namespace ferry {
namespace logging {

namespace {

/**
 * Sinks attached to the Boost.Log core by this library. Sinks created by
 * init_logging are owned: shutdown stops their feeding threads before
 * detaching them. Sinks handed in through add_sink are only detached.
 */
class SinkRegistry {
public:
  template <typename AsyncSink>
  void attach_owned(const boost::shared_ptr<AsyncSink>& sink) {
    attach(sink);
    stoppers_.push_back([sink] {
      sink->stop();
      sink->flush();
    });
  }

  void attach(const boost::shared_ptr<boost::log::sinks::sink>& sink) {
    boost::log::core::get()->add_sink(sink);
    sinks_.push_back(sink);
  }

  void detach(const boost::shared_ptr<boost::log::sinks::sink>& sink) {
    boost::log::core::get()->remove_sink(sink);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
  }

  void flush() {
    for (auto& sink : sinks_) {
      sink->flush();
    }
  }

  void detach_all() {
    for (auto& stop : stoppers_) {
      stop();
    }
    stoppers_.clear();

    auto core = boost::log::core::get();
    for (auto& sink : sinks_) {
      core->remove_sink(sink);
    }
    sinks_.clear();
  }

private:
  std::vector<boost::shared_ptr<boost::log::sinks::sink>> sinks_;
  std::vector<std::function<void()>> stoppers_;
};

std::mutex g_mutex;
SinkRegistry g_registry;
bool g_initialized = false;

std::optional<std::string> get_env(const char* name) {
  const char* value = std::getenv(name);
  if (value && value[0] != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

std::optional<bool> parse_bool(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (s == "true" || s == "1" || s == "yes" || s == "on") return true;
  if (s == "false" || s == "0" || s == "no" || s == "off") return false;
  return std::nullopt;
}

void override_level(const char* name, severity_level& level) {
  if (auto value = get_env(name)) {
    if (auto parsed = parse_severity_level(*value)) {
      level = *parsed;
    }
  }
}

void override_flag(const char* name, bool& flag) {
  if (auto value = get_env(name)) {
    if (auto parsed = parse_bool(*value)) {
      flag = *parsed;
    }
  }
}

}  // namespace

void apply_env_overrides(LoggingConfig& config) {
  if (auto value = get_env("FERRY_LOG_LEVEL")) {
    if (auto level = parse_severity_level(*value)) {
      config.console_level = *level;
      config.file_level = *level;
    }
  }
  // Per-sink levels win over FERRY_LOG_LEVEL
  override_level("FERRY_LOG_CONSOLE_LEVEL", config.console_level);
  override_level("FERRY_LOG_FILE_LEVEL", config.file_level);

  override_flag("FERRY_LOG_CONSOLE_ENABLED", config.console_enabled);
  override_flag("FERRY_LOG_FILE_ENABLED", config.file_enabled);

  if (auto dir = get_env("FERRY_LOG_FILE_DIR")) {
    config.file_config.directory = *dir;
  }
  if (auto format = get_env("FERRY_LOG_FORMAT")) {
    std::string lower = *format;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
      return static_cast<char>(std::tolower(c));
    });
    config.file_config.format_json = (lower == "json");
  }
}

logger_type& get_logger() {
  static logger_type instance;
  return instance;
}

void init_logging(const LoggingConfig& config) {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_initialized) {
    return;
  }

  boost::log::add_common_attributes();

  if (config.console_enabled) {
    g_registry.attach_owned(create_console_sink(config.console_level, config.console_colors));
  }
  if (config.file_enabled) {
    g_registry.attach_owned(create_file_sink(config.file_config, config.file_level));
  }
  g_initialized = true;
}

void init_logging_default() {
  init_logging(LoggingConfig());
}

void shutdown_logging() {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (!g_initialized) {
    return;
  }
  g_registry.detach_all();
  g_initialized = false;
}

void add_sink(boost::shared_ptr<boost::log::sinks::sink> sink) {
  std::lock_guard<std::mutex> lock(g_mutex);
  g_registry.attach(sink);
}

void remove_sink(boost::shared_ptr<boost::log::sinks::sink> sink) {
  std::lock_guard<std::mutex> lock(g_mutex);
  g_registry.detach(sink);
}

void flush_logging() {
  std::lock_guard<std::mutex> lock(g_mutex);
  g_registry.flush();
}

bool is_logging_initialized() {
  std::lock_guard<std::mutex> lock(g_mutex);
  return g_initialized;
}

}  // namespace logging
}  // namespace ferry
