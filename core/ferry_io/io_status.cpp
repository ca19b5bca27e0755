// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "io_status.hpp"

#include <sstream>

namespace ferry {
namespace io {

std::string Status::toString() const {
  if (success) {
    return "ok";
  }
  std::ostringstream oss;
  oss << errorKindToString(kind) << ": " << error_message;
  if (http_status != 0) {
    oss << " (status: " << http_status;
    if (!error_code.empty()) {
      oss << ", code: " << error_code;
    }
    oss << ")";
  }
  return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Status& status) {
  return os << status.toString();
}

}  // namespace io
}  // namespace ferry
