// Copyright (c) 2025 The monoclock Authors
/**
 * @file mach_clock.cc
 * @brief Apple mach_absolute_time() binding.
 *
 * See Technical Q&A QA1398: ticks are converted to nanoseconds with the
 * timebase ratio numer / denom, queried once at bind time.
 */
#include <mach/kern_return.h>
#include <mach/mach_time.h>

#include <cstdint>
#include <memory>
#include <sstream>

#include "monoclock/native_clock.hpp"

namespace monoclock {
namespace platform {

namespace {

class MachClock : public NativeClock {
 public:
  explicit MachClock(const mach_timebase_info_data_t& tb)
      : nanos_per_tick_(static_cast<double>(tb.numer) /
                        static_cast<double>(tb.denom)) {}

  bool Read(double* seconds, ClockError* /*error*/) const override {
    uint64_t ticks = mach_absolute_time();
    *seconds = static_cast<double>(ticks) * nanos_per_tick_ / 1e9;
    return true;
  }

  Primitive Kind() const override { return Primitive::kMachAbsoluteTime; }

 private:
  double nanos_per_tick_;
};

}  // namespace

std::unique_ptr<NativeClock> BindNativeClock(const ClockChoice& choice,
                                             ClockError* error) {
  if (choice.primitive != Primitive::kMachAbsoluteTime) {
    if (error) {
      std::ostringstream oss;
      oss << PrimitiveName(choice.primitive)
          << " is not available in this build (mach_absolute_time only)";
      *error = ClockError(ErrorCode::kBindingFailure, oss.str());
    }
    return nullptr;
  }

  mach_timebase_info_data_t tb{};
  kern_return_t kr = mach_timebase_info(&tb);
  if (kr != KERN_SUCCESS) {
    if (error) {
      std::ostringstream oss;
      oss << "mach_timebase_info failed (kern_return " << kr << ")";
      *error = ClockError(ErrorCode::kBindingFailure, oss.str(),
                          static_cast<int>(kr));
    }
    return nullptr;
  }
  if (tb.denom == 0 || tb.numer == 0) {
    if (error) {
      std::ostringstream oss;
      oss << "invalid mach timebase " << tb.numer << "/" << tb.denom;
      *error = ClockError(ErrorCode::kBindingFailure, oss.str());
    }
    return nullptr;
  }

  return std::make_unique<MachClock>(tb);
}

}  // namespace platform
}  // namespace monoclock
