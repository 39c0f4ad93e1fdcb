// Copyright (c) 2025 The monoclock Authors
/**
 * @file clock_resolver.hpp
 * @brief Selects, binds and validates the native monotonic clock.
 *
 * Resolution steps:
 * 1. Describe the host (platform::DetectHost() unless overridden).
 * 2. SelectClock() picks the primitive and clock id.
 * 3. The binder attaches the primitive (platform::BindNativeClock() unless
 *    overridden).
 * 4. Self-test: two back-to-back reads must not go backwards.
 *
 * Any failure is final; there is no fallback to another primitive.
 */
#pragma once

#include <functional>
#include <memory>
#include <ostream>
#include <string>

#include "monoclock/clock_error.hpp"
#include "monoclock/clock_selector.hpp"
#include "monoclock/export.hpp"
#include "monoclock/native_clock.hpp"

namespace monoclock {

/**
 * Immutable configuration options for ClockResolver.
 */
class MONOCLOCK_API Options {
 public:
  using LogCallback = std::function<void(const std::string&)>;
  using BindCallback = std::function<std::unique_ptr<NativeClock>(
      const ClockChoice&, ClockError*)>;

  class MONOCLOCK_API Builder {
   public:
    Builder();
    explicit Builder(const Options& base);

    /** Use @p host instead of detecting the running host. */
    Builder& Host(const HostInfo& host);
    /** Use @p binder instead of platform::BindNativeClock(). */
    Builder& Binder(BindCallback binder);
    /** Receive diagnostic messages (default: none). */
    Builder& LogSink(LogCallback cb);
    Options Build() const;

   private:
    bool has_host_;
    HostInfo host_;
    BindCallback binder_;
    LogCallback log_sink_cb_;
  };

  Options();

  /** True if Host() overrides detection. */
  bool HasHost() const { return has_host_; }
  const HostInfo& Host() const { return host_; }
  const BindCallback& Binder() const { return binder_; }
  const LogCallback& LogSink() const { return log_callback_; }

  /** Stream formatter for logging. */
  friend MONOCLOCK_API std::ostream& operator<<(std::ostream& os,
                                                const Options& o);

 private:
  Options(bool has_host, const HostInfo& host, BindCallback binder,
          LogCallback log_cb);

  bool has_host_;
  HostInfo host_;
  BindCallback binder_;
  LogCallback log_callback_;
};

/**
 * @brief A validated native clock.
 *
 * Immutable. Now() may be called concurrently from any thread.
 */
class MONOCLOCK_API MonotonicClock {
 public:
  MonotonicClock(const ClockChoice& choice,
                 std::unique_ptr<NativeClock> native);

  MonotonicClock(const MonotonicClock&) = delete;
  MonotonicClock& operator=(const MonotonicClock&) = delete;

  /**
   * @brief Returns the current reading in fractional seconds.
   * @return false with kNativeCallFailure if the native read failed. On
   *         success @p error (if given) is reset to ok.
   */
  bool Now(double* seconds, ClockError* error = nullptr) const;

  /** Selection this clock was built from. */
  const ClockChoice& Choice() const { return choice_; }

 private:
  ClockChoice choice_;
  std::unique_ptr<const NativeClock> native_;
};

/**
 * @brief Outcome of a resolution: a clock, or the fatal error.
 */
struct Resolution {
  std::unique_ptr<MonotonicClock> clock;
  ClockError error;
  HostInfo host;

  bool ok() const { return clock != nullptr; }
};

/**
 * @brief Runs the resolution steps with a fixed Options snapshot.
 */
class MONOCLOCK_API ClockResolver {
 public:
  explicit ClockResolver(const Options& options = Options());

  /** Resolves a new clock. Each call resolves from scratch. */
  Resolution Resolve() const;

 private:
  void Log(const std::string& text) const;

  Options options_;
};

}  // namespace monoclock
