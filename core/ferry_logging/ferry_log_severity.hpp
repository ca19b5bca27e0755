// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_LOG_SEVERITY_HPP
#define FERRY_LOG_SEVERITY_HPP

#include <boost/log/expressions/keyword.hpp>

#include <algorithm>
#include <cctype>
#include <optional>
#include <ostream>
#include <string>

namespace ferry {
namespace logging {

/**
 * Severity levels for ferry logging.
 * FATAL is reserved for failures that leave a transfer in an unknown state.
 */
enum class severity_level { debug = 0, info = 1, warn = 2, error = 3, fatal = 4 };

namespace detail {

struct SeverityName {
  const char* name;
  severity_level level;
};

// First entry per level is its canonical (printed) spelling
constexpr SeverityName kSeverityNames[] = {
  {"DEBUG", severity_level::debug}, {"INFO", severity_level::info},
  {"WARN", severity_level::warn},   {"WARNING", severity_level::warn},
  {"ERROR", severity_level::error}, {"FATAL", severity_level::fatal},
};

}  // namespace detail

inline const char* to_string(severity_level level) {
  for (const auto& entry : detail::kSeverityNames) {
    if (entry.level == level) {
      return entry.name;
    }
  }
  return "UNKNOWN";
}

/**
 * Parse a level name, case-insensitive. "warning" is accepted for WARN.
 *
 * @return The parsed level, or std::nullopt if the name is unknown
 */
inline std::optional<severity_level> parse_severity_level(const std::string& name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  for (const auto& entry : detail::kSeverityNames) {
    if (upper == entry.name) {
      return entry.level;
    }
  }
  return std::nullopt;
}

inline std::ostream& operator<<(std::ostream& strm, severity_level level) {
  return strm << to_string(level);
}

BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)
BOOST_LOG_ATTRIBUTE_KEYWORD(component, "Component", std::string)
BOOST_LOG_ATTRIBUTE_KEYWORD(target_path, "TargetPath", std::string)
BOOST_LOG_ATTRIBUTE_KEYWORD(session_id, "SessionId", std::string)

}  // namespace logging
}  // namespace ferry

#endif  // FERRY_LOG_SEVERITY_HPP
