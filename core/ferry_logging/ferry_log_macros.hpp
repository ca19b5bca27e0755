// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_LOG_MACROS_HPP
#define FERRY_LOG_MACROS_HPP

#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/utility/manipulators/add_value.hpp>
#include <boost/log/utility/unique_identifier_name.hpp>

#include <atomic>
#include <cstdint>
#include <sstream>
#include <string>

#include "ferry_log_severity.hpp"

namespace ferry {
namespace logging {

typedef boost::log::sources::severity_logger<severity_level> logger_type;

/**
 * Process-wide logger instance. Defined in ferry_log_init.cpp.
 */
logger_type& get_logger();

/**
 * Key-value fragment for structured log lines.
 * Usage: FERRY_LOG_INFO("chunk accepted" << kv("offset", start));
 */
template <typename T>
inline std::string kv(const char* name, const T& value) {
  std::ostringstream oss;
  oss << " " << name << "=" << value;
  return oss.str();
}

// Strings are quoted
template <>
inline std::string kv(const char* name, const std::string& value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

inline std::string kv(const char* name, const char* value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

}  // namespace logging
}  // namespace ferry

// =============================================================================
// Component identification
// Define FERRY_LOG_COMPONENT before including this header:
//
//   #define FERRY_LOG_COMPONENT "chunked_writer"
//   #include <ferry_log_macros.hpp>
// =============================================================================
#ifndef FERRY_LOG_COMPONENT
#define FERRY_LOG_COMPONENT "ferry"
#endif

// DEBUG records are compiled out of release builds
#ifdef NDEBUG
#define FERRY_LOG_ENABLE_DEBUG 0
#else
#define FERRY_LOG_ENABLE_DEBUG 1
#endif

// Every record carries its call site's component as the "Component" attribute
#define FERRY_LOG_AT(level, msg)                                                              \
  BOOST_LOG_SEV(::ferry::logging::get_logger(), level)                                        \
    << ::boost::log::add_value("Component", std::string(FERRY_LOG_COMPONENT)) << msg

#define FERRY_LOG_DEBUG(msg)                                                  \
  do {                                                                        \
    if (FERRY_LOG_ENABLE_DEBUG) {                                             \
      FERRY_LOG_AT(::ferry::logging::severity_level::debug, msg);             \
    }                                                                         \
  } while (0)

#define FERRY_LOG_INFO(msg)                                                   \
  do {                                                                        \
    FERRY_LOG_AT(::ferry::logging::severity_level::info, msg);                \
  } while (0)

#define FERRY_LOG_WARN(msg)                                                   \
  do {                                                                        \
    FERRY_LOG_AT(::ferry::logging::severity_level::warn, msg);                \
  } while (0)

#define FERRY_LOG_ERROR(msg)                                                  \
  do {                                                                        \
    FERRY_LOG_AT(::ferry::logging::severity_level::error, msg);               \
  } while (0)

#define FERRY_LOG_FATAL(msg)                                                  \
  do {                                                                        \
    FERRY_LOG_AT(::ferry::logging::severity_level::fatal, msg);               \
  } while (0)

// =============================================================================
// Transfer context, cleared when the enclosing scope exits.
// Usage: FERRY_LOG_SCOPED_CONTEXT("/docs/report.pdf", "upload-session");
// =============================================================================
#define FERRY_LOG_SCOPED_CONTEXT(target_path_val, session_id_val)                    \
  BOOST_LOG_SCOPED_THREAD_ATTR_INTERNAL(                                             \
    "TargetPath", boost::log::attributes::constant<std::string>(target_path_val),    \
    BOOST_LOG_UNIQUE_IDENTIFIER_NAME(_ferry_log_target_path_sentry_)                 \
  );                                                                                 \
  BOOST_LOG_SCOPED_THREAD_ATTR_INTERNAL(                                             \
    "SessionId", boost::log::attributes::constant<std::string>(session_id_val),      \
    BOOST_LOG_UNIQUE_IDENTIFIER_NAME(_ferry_log_session_id_sentry_)                  \
  )

namespace ferry {
namespace logging {

/**
 * Advances a per-call-site counter and reports whether this occurrence is
 * one of the 1st, (n+1)th, (2n+1)th... ones. n == 0 is treated as 1.
 */
inline bool sample_every_n(std::atomic<uint64_t>& counter, uint64_t n) {
  const uint64_t occurrence = counter.fetch_add(1, std::memory_order_relaxed);
  return n <= 1 || occurrence % n == 0;
}

}  // namespace logging
}  // namespace ferry

// =============================================================================
// Count-based sampling: log the 1st, (n+1)th, (2n+1)th... occurrence per call site.
// Usage: FERRY_LOG_DEBUG_EVERY_N(16, "chunk accepted" << kv("index", i));
// =============================================================================
#define FERRY_LOG_DEBUG_EVERY_N(n, msg)                                          \
  do {                                                                           \
    static std::atomic<uint64_t> _ferry_log_counter{0};                          \
    if (::ferry::logging::sample_every_n(_ferry_log_counter, (n))) {             \
      FERRY_LOG_DEBUG(msg);                                                      \
    }                                                                            \
  } while (0)

#define FERRY_LOG_INFO_EVERY_N(n, msg)                                           \
  do {                                                                           \
    static std::atomic<uint64_t> _ferry_log_counter{0};                          \
    if (::ferry::logging::sample_every_n(_ferry_log_counter, (n))) {             \
      FERRY_LOG_INFO(msg);                                                       \
    }                                                                            \
  } while (0)

#endif  // FERRY_LOG_MACROS_HPP
