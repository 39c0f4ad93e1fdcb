// Copyright (c) 2025 The monoclock Authors
/**
 * @file clock_error.cc
 * @brief ClockError formatting helpers.
 */
#include "monoclock/clock_error.hpp"

#include <cstring>
#include <sstream>
#include <string>

namespace monoclock {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:
      return "Ok";
    case ErrorCode::kUnsupportedPlatform:
      return "UnsupportedPlatform";
    case ErrorCode::kBindingFailure:
      return "BindingFailure";
    case ErrorCode::kNativeCallFailure:
      return "NativeCallFailure";
    case ErrorCode::kSanityCheckFailure:
      return "SanityCheckFailure";
  }
  return "Unknown";
}

std::string FormatErrno(const std::string& context, int err) {
  std::ostringstream oss;
  oss << context << " (errno " << err << ": " << std::strerror(err) << ")";
  return oss.str();
}

std::ostream& operator<<(std::ostream& os, const ClockError& e) {
  os << ErrorCodeName(e.code);
  if (!e.message.empty()) {
    os << ": " << e.message;
  }
  return os;
}

}  // namespace monoclock
