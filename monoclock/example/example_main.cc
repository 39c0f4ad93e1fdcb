// Copyright (c) 2025 The monoclock Authors
/**
 * @file
 * @brief Example program: resolve the process clock and print readings.
 *
 * Usage:
 *   monoclock_example --samples 5 --interval-ms 200 --verbose
 */
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>

#include "monoclock/monotonic.hpp"

namespace {
/**
 * @brief Thread-safe logger for debug messages.
 */
class Logger {
 public:
  explicit Logger(bool enabled) : enabled_(enabled) {}

  void Log(const std::string& msg) {
    if (!enabled_) return;
    std::lock_guard<std::mutex> lock(mutex_);
    std::fprintf(stderr, "%s\n", msg.c_str());
  }

 private:
  bool enabled_;
  std::mutex mutex_;
};

void PrintUsage() {
  std::fprintf(stderr,
               "Usage: monoclock_example [--samples N] [--interval-ms N] "
               "[--verbose]\n");
}
}  // namespace

int main(int argc, char** argv) {
  int samples = 5;
  int interval_ms = 200;
  bool verbose = false;

  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto need = [&](int n) { return i + n < argc; };
    if (a == "--samples" && need(1)) {
      samples = std::atoi(argv[++i]);
    } else if (a == "--interval-ms" && need(1)) {
      interval_ms = std::atoi(argv[++i]);
    } else if (a == "--verbose") {
      verbose = true;
    } else if (a == "-h" || a == "--help") {
      PrintUsage();
      return 0;
    } else {
      std::fprintf(stderr, "Unknown option: %s\n", a.c_str());
      PrintUsage();
      return 2;
    }
  }
  if (samples < 1) samples = 1;
  if (interval_ms < 0) interval_ms = 0;

  Logger logger(verbose);
  auto log_callback = [&logger](const std::string& msg) { logger.Log(msg); };
  auto opts = monoclock::Options::Builder().LogSink(log_callback).Build();

  const monoclock::Resolution& clock = monoclock::InitializeProcessClock(opts);
  if (!clock.ok()) {
    std::ostringstream oss;
    oss << clock.error;
    std::fprintf(stderr, "no monotonic clock on this host: %s\n",
                 oss.str().c_str());
    return 1;
  }
  {
    std::ostringstream oss;
    oss << clock.host << " -> " << clock.clock->Choice();
    std::printf("%s\n", oss.str().c_str());
  }

  double start = 0.0;
  monoclock::ClockError err;
  if (!monoclock::Monotonic(&start, &err)) {
    std::ostringstream oss;
    oss << err;
    std::fprintf(stderr, "read failed: %s\n", oss.str().c_str());
    return 1;
  }

  for (int i = 0; i < samples; ++i) {
    if (i > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(interval_ms));
    }
    double now = 0.0;
    if (!monoclock::Monotonic(&now, &err)) {
      std::ostringstream oss;
      oss << err;
      std::fprintf(stderr, "read failed: %s\n", oss.str().c_str());
      return 1;
    }
    std::printf("t=%.9f elapsed=%.6f\n", now, now - start);
  }
  return 0;
}
