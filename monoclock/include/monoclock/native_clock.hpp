// Copyright (c) 2025 The monoclock Authors
/**
 * @file native_clock.hpp
 * @brief Interface for a bound native monotonic primitive.
 */
#pragma once

#include <memory>

#include "monoclock/clock_error.hpp"
#include "monoclock/clock_selector.hpp"
#include "monoclock/export.hpp"

namespace monoclock {

/**
 * Interface for native clock bindings.
 * Implementations are immutable after construction and safe to read from
 * any thread.
 */
class NativeClock {
 public:
  virtual ~NativeClock() = default;

  /**
   * @brief Reads the clock.
   *
   * @param seconds Output reading in fractional seconds.
   * @param error Filled with kNativeCallFailure on failure (may be null).
   * @return true on success. On failure @p seconds is left untouched.
   */
  virtual bool Read(double* seconds, ClockError* error) const = 0;

  /** Returns the primitive this binding reads. */
  virtual Primitive Kind() const = 0;
};

namespace platform {

/**
 * @brief Binds @p choice to the primitive provided by this build.
 *
 * @param choice Selection result.
 * @param error Filled with kBindingFailure on failure (may be null).
 * @return Bound clock, or nullptr if the primitive is not available here or
 *         the OS rejects it.
 */
MONOCLOCK_API std::unique_ptr<NativeClock> BindNativeClock(
    const ClockChoice& choice, ClockError* error);

}  // namespace platform

}  // namespace monoclock
