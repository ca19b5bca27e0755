// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "ferry_log_format.hpp"

#include <boost/date_time/posix_time/posix_time_io.hpp>
#include <boost/date_time/posix_time/time_formatters.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace ferry {
namespace logging {

namespace expr = boost::log::expressions;

namespace {

const char* const kResetColor = "\033[0m";

typedef boost::log::attributes::current_thread_id::value_type thread_id_type;

std::string thread_id_string(const boost::log::record_view& rec) {
  auto tid = boost::log::extract<thread_id_type>("ThreadID", rec);
  if (!tid) {
    return std::string();
  }
  std::ostringstream oss;
  oss << *tid;
  return oss.str();
}

}  // namespace

const char* severity_color(severity_level level) {
  switch (level) {
    case severity_level::debug:
      return "\033[36m";
    case severity_level::info:
      return "\033[32m";
    case severity_level::warn:
      return "\033[33m";
    case severity_level::error:
      return "\033[31m";
    case severity_level::fatal:
      return "\033[35m";
  }
  return "";
}

void format_text(
  const boost::log::record_view& rec, boost::log::formatting_ostream& strm, const TextLayout& layout
) {
  strm << "[";
  if (auto ts = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec)) {
    strm << *ts;
  }
  strm << "] ";

  if (layout.thread_id) {
    std::string tid = thread_id_string(rec);
    if (!tid.empty()) {
      strm << "[" << tid << "] ";
    }
  }

  if (auto sev = rec[severity]) {
    if (layout.colors) {
      strm << severity_color(*sev) << "[" << *sev << "]" << kResetColor << " ";
    } else {
      strm << "[" << *sev << "] ";
    }
  }

  if (auto comp = rec[component]) {
    strm << "[" << *comp << "] ";
  }

  strm << rec[expr::smessage];

  auto path = rec[target_path];
  auto session = rec[session_id];
  if (path || session) {
    strm << " |";
    if (path) strm << " path=" << *path;
    if (session) strm << " session=" << *session;
  }
}

void format_json(const boost::log::record_view& rec, boost::log::formatting_ostream& strm) {
  nlohmann::json line;

  if (auto ts = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec)) {
    line["ts"] = boost::posix_time::to_iso_extended_string(*ts);
  }
  if (auto sev = rec[severity]) {
    line["level"] = to_string(*sev);
  }
  if (auto comp = rec[component]) {
    line["component"] = *comp;
  }
  if (auto msg = rec[expr::smessage]) {
    line["msg"] = *msg;
  }
  std::string tid = thread_id_string(rec);
  if (!tid.empty()) {
    line["thread_id"] = tid;
  }
  if (auto path = rec[target_path]) {
    line["path"] = *path;
  }
  if (auto session = rec[session_id]) {
    line["session"] = *session;
  }

  strm << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace logging
}  // namespace ferry
