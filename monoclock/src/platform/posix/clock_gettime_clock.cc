// Copyright (c) 2025 The monoclock Authors
/**
 * @file clock_gettime_clock.cc
 * @brief POSIX clock_gettime() binding (Linux, BSD family, Solaris family).
 */
#include <time.h>

#include <cerrno>
#include <memory>
#include <sstream>
#include <string>

#include "monoclock/native_clock.hpp"

// Clock ids chosen by SelectClock() are ABI values; make sure they match the
// headers of the OS we are building for.
#if defined(__linux__)
static_assert(CLOCK_MONOTONIC == monoclock::kLinuxClockMonotonic,
              "unexpected CLOCK_MONOTONIC");
static_assert(CLOCK_MONOTONIC_RAW == monoclock::kLinuxClockMonotonicRaw,
              "unexpected CLOCK_MONOTONIC_RAW");
#elif defined(__FreeBSD__)
static_assert(CLOCK_MONOTONIC == monoclock::kFreeBsdClockMonotonic,
              "unexpected CLOCK_MONOTONIC");
#elif defined(__sun)
static_assert(CLOCK_MONOTONIC == monoclock::kSolarisClockMonotonic,
              "unexpected CLOCK_MONOTONIC");
#elif defined(__OpenBSD__) || defined(__NetBSD__)
static_assert(CLOCK_MONOTONIC == monoclock::kBsdClockMonotonic,
              "unexpected CLOCK_MONOTONIC");
#endif

namespace monoclock {
namespace platform {

namespace {

class ClockGettimeClock : public NativeClock {
 public:
  explicit ClockGettimeClock(clockid_t id) : id_(id) {}

  bool Read(double* seconds, ClockError* error) const override {
    timespec ts{};
    if (clock_gettime(id_, &ts) != 0) {
      int err = errno;
      if (error) {
        *error = ClockError(ErrorCode::kNativeCallFailure,
                            FormatErrno("clock_gettime failed", err), err);
      }
      return false;
    }
    *seconds =
        static_cast<double>(ts.tv_sec) + static_cast<double>(ts.tv_nsec) / 1e9;
    return true;
  }

  Primitive Kind() const override { return Primitive::kClockGettime; }

 private:
  clockid_t id_;
};

}  // namespace

std::unique_ptr<NativeClock> BindNativeClock(const ClockChoice& choice,
                                             ClockError* error) {
  if (choice.primitive != Primitive::kClockGettime) {
    if (error) {
      std::ostringstream oss;
      oss << PrimitiveName(choice.primitive)
          << " is not available in this build (clock_gettime only)";
      *error = ClockError(ErrorCode::kBindingFailure, oss.str());
    }
    return nullptr;
  }

  // Check the id so a clock the kernel lacks fails here, not on first read.
  clockid_t id = static_cast<clockid_t>(choice.clock_id);
  timespec res{};
  if (clock_getres(id, &res) != 0) {
    int err = errno;
    if (error) {
      std::ostringstream oss;
      oss << "clock_getres(" << choice.clock_id << ") failed";
      *error = ClockError(ErrorCode::kBindingFailure,
                          FormatErrno(oss.str(), err), err);
    }
    return nullptr;
  }

  return std::make_unique<ClockGettimeClock>(id);
}

}  // namespace platform
}  // namespace monoclock
