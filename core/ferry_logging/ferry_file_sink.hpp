// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_FILE_SINK_HPP
#define FERRY_FILE_SINK_HPP

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include <cstdint>
#include <string>

#include "ferry_log_severity.hpp"

namespace ferry {
namespace logging {

// Deeper queue than the console sink; a debug-level file sink sees every chunk
typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_file_backend,
  boost::log::sinks::bounded_fifo_queue<5000, boost::log::sinks::drop_on_overflow>>
  async_file_sink_t;

/**
 * File sink configuration.
 */
struct FileSinkConfig {
  std::string directory = "/var/log/ferry";
  std::string file_pattern = "ferry_%Y%m%d_%H%M%S.log";
  uint64_t rotation_size_mb = 100;  // Rotate at 100MB
  bool rotate_at_midnight = true;   // Also rotate daily
  int max_files = 10;               // Keep 10 rotated files
  bool format_json = true;          // One JSON object per line
};

/**
 * File sink with size and midnight rotation. JSON records use format_json,
 * text records the text layout with thread ids.
 */
boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level = severity_level::debug
);

/**
 * Create the directory if needed and return it, or "/tmp" when it cannot
 * be used. The reason is reported on stderr.
 */
std::string resolve_log_directory(const std::string& directory);

}  // namespace logging
}  // namespace ferry

#endif  // FERRY_FILE_SINK_HPP
