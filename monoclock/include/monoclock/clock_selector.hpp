// Copyright (c) 2025 The monoclock Authors
/**
 * @file clock_selector.hpp
 * @brief Maps a host description to the native monotonic primitive to use.
 *
 * Selection is a pure function of HostInfo so it can be exercised for any
 * platform from any build host. Binding the choice to a real primitive is
 * done separately (see native_clock.hpp).
 */
#pragma once

#include <ostream>
#include <string>

#include "monoclock/clock_error.hpp"
#include "monoclock/export.hpp"

namespace monoclock {

/**
 * @brief Host description used for selection.
 *
 * system is a lowercase platform identifier ("linux", "darwin", "win32",
 * "cygwin", "freebsd13", "openbsd7", "netbsd", "sunos5"). release is the OS
 * release string, e.g. "5.10.0-amd64".
 */
struct HostInfo {
  std::string system;
  std::string release;

  HostInfo() = default;
  HostInfo(const std::string& sys, const std::string& rel)
      : system(sys), release(rel) {}
};

/** Native primitive families. */
enum class Primitive {
  kNone = 0,
  kMachAbsoluteTime,  ///< mach_absolute_time() scaled by the timebase
  kTickCount64,       ///< GetTickCount64(), milliseconds since boot
  kClockGettime,      ///< clock_gettime(clock_id)
};

/** Monotonic clock variants of the POSIX path. */
enum class ClockKind {
  kMonotonic = 0,  ///< Standard monotonic clock (may be NTP-slewed)
  kMonotonicRaw,   ///< Linux raw hardware clock, immune to slewing
};

/** Result of selection. */
struct ClockChoice {
  Primitive primitive = Primitive::kNone;
  ClockKind kind = ClockKind::kMonotonic;
  /** Native clock id in the target OS ABI (clock_gettime path only). */
  int clock_id = -1;
  /** Human-readable description, e.g. "clock_gettime(CLOCK_MONOTONIC_RAW)". */
  std::string description;
};

/** Linux kernels newer than this get CLOCK_MONOTONIC_RAW. */
constexpr const char* kLinuxRawClockThreshold = "2.6.28";

/** @name Clock ids by target ABI */
///@{
constexpr int kLinuxClockMonotonic = 1;
constexpr int kLinuxClockMonotonicRaw = 4;
constexpr int kFreeBsdClockMonotonic = 4;
constexpr int kSolarisClockMonotonic = 4;
constexpr int kBsdClockMonotonic = 3;
///@}

/**
 * @brief Chooses the native primitive for @p host.
 *
 * @param host Host description.
 * @param choice Output choice, valid only on success.
 * @param error Filled with kUnsupportedPlatform on failure (may be null).
 * @return true if a primitive was selected.
 */
MONOCLOCK_API bool SelectClock(const HostInfo& host, ClockChoice* choice,
                               ClockError* error);

/** Returns a stable name such as "ClockGettime". */
MONOCLOCK_API const char* PrimitiveName(Primitive primitive);

/** Stream formatters for logging. */
MONOCLOCK_API std::ostream& operator<<(std::ostream& os, const HostInfo& h);
MONOCLOCK_API std::ostream& operator<<(std::ostream& os,
                                       const ClockChoice& c);

namespace platform {

/**
 * @brief Describes the running host.
 *
 * POSIX builds use uname(2); Windows builds report "win32" and the OS
 * version. On failure system is left empty, which SelectClock() rejects.
 */
MONOCLOCK_API HostInfo DetectHost();

}  // namespace platform

}  // namespace monoclock
