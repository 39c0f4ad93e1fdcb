// Copyright (c) 2025 The monoclock Authors
/**
 * @file clock_error.hpp
 * @brief Error record shared by clock selection, binding and reads.
 */
#pragma once

#include <ostream>
#include <string>

#include "monoclock/export.hpp"

namespace monoclock {

/** Failure categories. Everything except kNativeCallFailure is fatal. */
enum class ErrorCode {
  kOk = 0,
  kUnsupportedPlatform,  ///< No platform path matches the host
  kBindingFailure,       ///< Native primitive unavailable or rejected
  kNativeCallFailure,    ///< Native read failed at call time
  kSanityCheckFailure,   ///< Self-test readings went backwards
};

/**
 * @brief Error details.
 *
 * native_code holds errno (POSIX), kern_return_t (Apple) or GetLastError()
 * (Windows) when the failure came from the OS, and 0 otherwise.
 */
struct ClockError {
  ErrorCode code = ErrorCode::kOk;
  int native_code = 0;
  std::string message;

  ClockError() = default;
  ClockError(ErrorCode c, const std::string& msg, int native = 0)
      : code(c), native_code(native), message(msg) {}

  bool ok() const { return code == ErrorCode::kOk; }

  /** True for the failures that make the clock permanently unavailable. */
  bool IsFatal() const {
    return code != ErrorCode::kOk && code != ErrorCode::kNativeCallFailure;
  }
};

/** Returns a stable name such as "UnsupportedPlatform". */
MONOCLOCK_API const char* ErrorCodeName(ErrorCode code);

/**
 * @brief Formats "context (errno N: text)" for the errno value @p err.
 */
MONOCLOCK_API std::string FormatErrno(const std::string& context, int err);

/** Stream formatter for logging. */
MONOCLOCK_API std::ostream& operator<<(std::ostream& os, const ClockError& e);

}  // namespace monoclock
