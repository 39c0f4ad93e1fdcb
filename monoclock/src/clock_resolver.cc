// Copyright (c) 2025 The monoclock Authors
/**
 * @file clock_resolver.cc
 * @brief Clock selection, binding and self-test.
 */
#include "monoclock/clock_resolver.hpp"

#include <iomanip>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

namespace monoclock {

// ---------------- Options ----------------
Options::Builder::Builder() : has_host_(false) {}

Options::Builder::Builder(const Options& base)
    : has_host_(base.HasHost()),
      host_(base.Host()),
      binder_(base.Binder()),
      log_sink_cb_(base.LogSink()) {}

Options::Builder& Options::Builder::Host(const HostInfo& host) {
  has_host_ = true;
  host_ = host;
  return *this;
}

Options::Builder& Options::Builder::Binder(BindCallback binder) {
  binder_ = std::move(binder);
  return *this;
}

Options::Builder& Options::Builder::LogSink(LogCallback cb) {
  log_sink_cb_ = std::move(cb);
  return *this;
}

Options Options::Builder::Build() const {
  return Options(has_host_, host_, binder_, log_sink_cb_);
}

Options::Options() : has_host_(false) {}

Options::Options(bool has_host, const HostInfo& host, BindCallback binder,
                 LogCallback log_cb)
    : has_host_(has_host),
      host_(host),
      binder_(std::move(binder)),
      log_callback_(std::move(log_cb)) {}

std::ostream& operator<<(std::ostream& os, const Options& o) {
  os << "host=";
  if (o.HasHost()) {
    os << "{" << o.Host() << "}";
  } else {
    os << "auto";
  }
  os << ", binder=" << (o.Binder() ? "custom" : "platform")
     << ", log=" << (o.LogSink() ? "on" : "off");
  return os;
}

// ---------------- MonotonicClock ----------------
MonotonicClock::MonotonicClock(const ClockChoice& choice,
                               std::unique_ptr<NativeClock> native)
    : choice_(choice), native_(std::move(native)) {}

bool MonotonicClock::Now(double* seconds, ClockError* error) const {
  if (!native_->Read(seconds, error)) return false;
  if (error) *error = ClockError();
  return true;
}

// ---------------- ClockResolver ----------------
ClockResolver::ClockResolver(const Options& options) : options_(options) {}

void ClockResolver::Log(const std::string& text) const {
  if (options_.LogSink()) {
    options_.LogSink()(text);
  }
}

Resolution ClockResolver::Resolve() const {
  Resolution r;
  r.host = options_.HasHost() ? options_.Host() : platform::DetectHost();
  {
    std::ostringstream oss;
    oss << "[monoclock] host " << r.host
        << (options_.HasHost() ? " (override)" : "");
    Log(oss.str());
  }

  ClockChoice choice;
  if (!SelectClock(r.host, &choice, &r.error)) {
    Log("[monoclock] selection failed: " + r.error.message);
    return r;
  }

  ClockError bind_error;
  std::unique_ptr<NativeClock> native =
      options_.Binder() ? options_.Binder()(choice, &bind_error)
                        : platform::BindNativeClock(choice, &bind_error);
  if (!native) {
    r.error = ClockError(ErrorCode::kBindingFailure,
                         bind_error.message.empty()
                             ? "no binding for " + choice.description
                             : bind_error.message,
                         bind_error.native_code);
    Log("[monoclock] binding failed: " + r.error.message);
    return r;
  }
  if (native->Kind() != choice.primitive) {
    std::ostringstream oss;
    oss << "binder returned " << PrimitiveName(native->Kind()) << " for "
        << PrimitiveName(choice.primitive);
    r.error = ClockError(ErrorCode::kBindingFailure, oss.str());
    Log("[monoclock] binding failed: " + r.error.message);
    return r;
  }

  // Self-test: back-to-back readings must not go backwards.
  double t1 = 0.0;
  double t2 = 0.0;
  ClockError read_error;
  if (!native->Read(&t1, &read_error) || !native->Read(&t2, &read_error)) {
    r.error = ClockError(ErrorCode::kSanityCheckFailure,
                         "self-test read failed: " + read_error.message,
                         read_error.native_code);
    Log("[monoclock] " + r.error.message);
    return r;
  }
  if (t2 < t1) {
    std::ostringstream oss;
    oss << std::setprecision(17) << "clock is not monotonic: " << t1
        << " followed by " << t2;
    r.error = ClockError(ErrorCode::kSanityCheckFailure, oss.str());
    Log("[monoclock] self-test failed: " + r.error.message);
    return r;
  }

  {
    std::ostringstream oss;
    oss << "[monoclock] selected " << choice;
    Log(oss.str());
  }
  r.clock = std::make_unique<MonotonicClock>(choice, std::move(native));
  return r;
}

}  // namespace monoclock
