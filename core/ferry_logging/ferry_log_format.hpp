// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_LOG_FORMAT_HPP
#define FERRY_LOG_FORMAT_HPP

#include <boost/log/core/record_view.hpp>
#include <boost/log/utility/formatting_ostream.hpp>

#include <string>

#include "ferry_log_severity.hpp"

namespace ferry {
namespace logging {

/**
 * Options for the human-readable record layout:
 *
 *   [2026-10-18 09:14:03.120] [INFO] [chunked_writer] chunk accepted offset=0 | path=/a.bin session=1f2e
 *
 * The trailing "| path=... session=..." block appears only inside a
 * FERRY_LOG_SCOPED_CONTEXT scope.
 */
struct TextLayout {
  bool colors = false;     // ANSI color around the severity tag
  bool thread_id = false;  // "[tid]" after the timestamp
};

void format_text(
  const boost::log::record_view& rec, boost::log::formatting_ostream& strm, const TextLayout& layout
);

/**
 * One JSON object per record with keys ts, level, component, msg, thread_id
 * and, inside a transfer scope, path and session. Invalid UTF-8 in the message
 * is replaced rather than dropping the record.
 */
void format_json(const boost::log::record_view& rec, boost::log::formatting_ostream& strm);

// ANSI escape for the severity tag, empty for unknown levels
const char* severity_color(severity_level level);

}  // namespace logging
}  // namespace ferry

#endif  // FERRY_LOG_FORMAT_HPP
