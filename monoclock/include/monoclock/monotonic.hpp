// Copyright (c) 2025 The monoclock Authors
/**
 * @file monotonic.hpp
 * @brief Process-wide monotonic clock.
 *
 * The clock is resolved once per process, on the first call to any function
 * below. The outcome (clock or fatal error) is cached: a failed resolution is
 * reported again on every access and never retried.
 *
 * Example:
 * @code
 *   double start = 0.0;
 *   monoclock::ClockError err;
 *   if (!monoclock::Monotonic(&start, &err)) {
 *     // timing is unavailable on this host
 *   }
 * @endcode
 */
#pragma once

#include "monoclock/clock_error.hpp"
#include "monoclock/clock_resolver.hpp"
#include "monoclock/export.hpp"

namespace monoclock {

/**
 * @brief Resolves the process clock with @p options.
 *
 * Only the first resolution in the process uses its options; if the clock was
 * already resolved (explicitly or by Monotonic()), the existing state is
 * returned unchanged.
 */
MONOCLOCK_API const Resolution& InitializeProcessClock(const Options& options);

/** Returns the process clock state, resolving it with defaults if needed. */
MONOCLOCK_API const Resolution& ProcessClock();

/**
 * @brief Reads the process clock.
 *
 * @param seconds Output reading in fractional seconds. Non-decreasing across
 *        calls; unrelated to wall-clock time.
 * @param error Optional. Receives the cached fatal error if resolution
 *        failed, or kNativeCallFailure if this read failed. Reset to ok
 *        on success.
 * @return true on success.
 */
MONOCLOCK_API bool Monotonic(double* seconds, ClockError* error = nullptr);

}  // namespace monoclock
