// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_IO_STATUS_HPP
#define FERRY_IO_STATUS_HPP

#include <ostream>
#include <string>

namespace ferry {
namespace io {

/**
 * Classification of a failed transfer operation
 */
enum class ErrorKind {
  None,         // Not an error
  Config,       // Malformed path, unknown compression tag, invalid settings
  Backend,      // Remote returned a non-success status
  Protocol,     // Chunk framing invariant violated before a request was sent
  IO,           // Source, sink, file or transport failure
  Unsupported,  // Operation the wrapper cannot serve (backward seek, write after close)
};

inline const char* errorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None:
      return "none";
    case ErrorKind::Config:
      return "config";
    case ErrorKind::Backend:
      return "backend";
    case ErrorKind::Protocol:
      return "protocol";
    case ErrorKind::IO:
      return "io";
    case ErrorKind::Unsupported:
      return "unsupported";
    default:
      return "unknown";
  }
}

/**
 * Result of a fallible kernel operation
 *
 * Backend failures also carry the HTTP status and the remote error code so an
 * outer retry layer can classify them; nothing inside ferry retries.
 */
struct Status {
  bool success;
  ErrorKind kind;
  std::string error_message;
  std::string error_code;  // Remote error code, e.g. "itemNotFound"
  int http_status;         // 0 when no response was received
  bool is_retryable;       // Hint for the caller's retry policy

  bool ok() const {
    return success;
  }

  static Status Success() {
    return {true, ErrorKind::None, "", "", 0, false};
  }

  static Status Failure(ErrorKind kind, const std::string& message) {
    return {false, kind, message, "", 0, false};
  }

  static Status BackendFailure(
    int http_status, const std::string& message, const std::string& code, bool retryable
  ) {
    return {false, ErrorKind::Backend, message, code, http_status, retryable};
  }

  std::string toString() const;
};

std::ostream& operator<<(std::ostream& os, const Status& status);

}  // namespace io
}  // namespace ferry

#endif  // FERRY_IO_STATUS_HPP
