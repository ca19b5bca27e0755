// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_LOG_INIT_HPP
#define FERRY_LOG_INIT_HPP

#include <boost/log/sinks/sink.hpp>

#include <string>

#include "ferry_console_sink.hpp"
#include "ferry_file_sink.hpp"
#include "ferry_log_severity.hpp"

namespace ferry {
namespace logging {

/**
 * Logging configuration for ferry processes.
 */
struct LoggingConfig {
  // Console sink
  bool console_enabled = true;
  bool console_colors = true;
  severity_level console_level = severity_level::info;

  // File sink
  bool file_enabled = false;
  FileSinkConfig file_config;
  severity_level file_level = severity_level::debug;
};

/**
 * Apply environment variable overrides to a LoggingConfig in place.
 *
 *   FERRY_LOG_LEVEL           - Global level (overrides both console and file)
 *   FERRY_LOG_CONSOLE_LEVEL   - Console sink level
 *   FERRY_LOG_FILE_LEVEL      - File sink level
 *   FERRY_LOG_FILE_DIR        - Log file directory
 *   FERRY_LOG_FORMAT          - File format ("json" or "text")
 *   FERRY_LOG_FILE_ENABLED    - Enable file logging ("true" or "false")
 *   FERRY_LOG_CONSOLE_ENABLED - Enable console logging ("true" or "false")
 */
void apply_env_overrides(LoggingConfig& config);

/**
 * Attach the console and file sinks the config enables. A second call while
 * logging is up leaves the existing sinks alone.
 */
void init_logging(const LoggingConfig& config);

/**
 * Initialize with console at INFO and file logging disabled.
 */
void init_logging_default();

/**
 * Stop async sink threads, flush pending records and detach all sinks.
 */
void shutdown_logging();

/**
 * Add a custom sink to the logging core.
 */
void add_sink(boost::shared_ptr<boost::log::sinks::sink> sink);

/**
 * Remove a sink previously added with add_sink().
 */
void remove_sink(boost::shared_ptr<boost::log::sinks::sink> sink);

void flush_logging();

bool is_logging_initialized();

/**
 * Keeps logging up for the lifetime of a command. Shutdown drains the async
 * queues, so records written just before an early return still reach disk.
 */
class ScopedLogging {
public:
  explicit ScopedLogging(const LoggingConfig& config) {
    init_logging(config);
  }
  ~ScopedLogging() {
    shutdown_logging();
  }

  ScopedLogging(const ScopedLogging&) = delete;
  ScopedLogging& operator=(const ScopedLogging&) = delete;
};

}  // namespace logging
}  // namespace ferry

#endif  // FERRY_LOG_INIT_HPP
