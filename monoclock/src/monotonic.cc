// Copyright (c) 2025 The monoclock Authors
/**
 * @file monotonic.cc
 * @brief Once-initialized process clock.
 */
#include "monoclock/monotonic.hpp"

#include <mutex>

namespace monoclock {

namespace {

std::once_flag g_resolve_once;

Resolution& ProcessState() {
  static Resolution state;
  return state;
}

}  // namespace

const Resolution& InitializeProcessClock(const Options& options) {
  Resolution& state = ProcessState();
  std::call_once(g_resolve_once,
                 [&]() { state = ClockResolver(options).Resolve(); });
  return state;
}

const Resolution& ProcessClock() { return InitializeProcessClock(Options()); }

bool Monotonic(double* seconds, ClockError* error) {
  const Resolution& r = ProcessClock();
  if (!r.ok()) {
    if (error) *error = r.error;
    return false;
  }
  return r.clock->Now(seconds, error);
}

}  // namespace monoclock
