// Copyright (c) 2025 The monoclock Authors
/**
 * @file tick_count_clock.cc
 * @brief Windows / Cygwin GetTickCount64() binding.
 *
 * GetTickCount64 needs Windows Vista / Server 2008 or newer. The 64-bit
 * counter does not wrap within any practical process lifetime.
 */
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>

#include <memory>
#include <sstream>

#include "monoclock/native_clock.hpp"

namespace monoclock {
namespace platform {

namespace {

class TickCountClock : public NativeClock {
 public:
  bool Read(double* seconds, ClockError* /*error*/) const override {
    ULONGLONG ticks = GetTickCount64();
    *seconds = static_cast<double>(ticks) / 1000.0;
    return true;
  }

  Primitive Kind() const override { return Primitive::kTickCount64; }
};

}  // namespace

std::unique_ptr<NativeClock> BindNativeClock(const ClockChoice& choice,
                                             ClockError* error) {
  if (choice.primitive != Primitive::kTickCount64) {
    if (error) {
      std::ostringstream oss;
      oss << PrimitiveName(choice.primitive)
          << " is not available in this build (GetTickCount64 only)";
      *error = ClockError(ErrorCode::kBindingFailure, oss.str());
    }
    return nullptr;
  }
  return std::make_unique<TickCountClock>();
}

}  // namespace platform
}  // namespace monoclock
