// Copyright (c) 2025 The monoclock Authors
/**
 * @file
 * @test OptionsTest.BuilderAndStream
 * @brief Verify Options builder and stream operator.
 *
 * @steps
 * 1. Build Options via Builder with a host override.
 * 2. Stream to ostringstream.
 *
 * @expected Stream contains the host and binder fields.
 */
#include "monoclock/clock_resolver.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using monoclock::ClockChoice;
using monoclock::ClockError;
using monoclock::ClockResolver;
using monoclock::ErrorCode;
using monoclock::HostInfo;
using monoclock::NativeClock;
using monoclock::Options;
using monoclock::Primitive;
using monoclock::Resolution;

TEST(OptionsTest, BuilderAndStream) {
  auto opts = Options::Builder().Host(HostInfo("linux", "5.10.0")).Build();
  std::ostringstream oss;
  oss << opts;
  EXPECT_NE(oss.str().find("system=linux"), std::string::npos);
  EXPECT_NE(oss.str().find("binder=platform"), std::string::npos);
  EXPECT_NE(oss.str().find("log=off"), std::string::npos);

  auto defaults = Options();
  EXPECT_FALSE(defaults.HasHost());
  std::ostringstream oss2;
  oss2 << defaults;
  EXPECT_NE(oss2.str().find("host=auto"), std::string::npos);
}

TEST(OptionsTest, BuilderFromBaseKeepsFields) {
  auto base = Options::Builder()
                  .Host(HostInfo("freebsd13", "13.2"))
                  .LogSink([](const std::string&) {})
                  .Build();
  auto copy = Options::Builder(base).Build();
  EXPECT_TRUE(copy.HasHost());
  EXPECT_EQ(copy.Host().system, "freebsd13");
  EXPECT_TRUE(static_cast<bool>(copy.LogSink()));
  EXPECT_FALSE(static_cast<bool>(copy.Binder()));
}

namespace {

/** Replays a fixed sequence of readings, repeating the last one. */
class FakeNativeClock : public NativeClock {
 public:
  explicit FakeNativeClock(std::vector<double> readings,
                           Primitive kind = Primitive::kClockGettime)
      : readings_(std::move(readings)), kind_(kind) {}

  bool Read(double* seconds, ClockError* /*error*/) const override {
    size_t i = next_.fetch_add(1);
    *seconds = readings_[std::min(i, readings_.size() - 1)];
    return true;
  }

  Primitive Kind() const override { return kind_; }

 private:
  std::vector<double> readings_;
  Primitive kind_;
  mutable std::atomic<size_t> next_{0};
};

/** Fails every read with EINVAL. */
class FailingNativeClock : public NativeClock {
 public:
  bool Read(double* /*seconds*/, ClockError* error) const override {
    if (error) {
      std::string msg = monoclock::FormatErrno("clock_gettime failed", EINVAL);
      *error = ClockError(ErrorCode::kNativeCallFailure, msg, EINVAL);
    }
    return false;
  }

  Primitive Kind() const override { return Primitive::kClockGettime; }
};

/** Succeeds except on the read numbered @p fail_at (0-based). */
class OneFailureNativeClock : public NativeClock {
 public:
  explicit OneFailureNativeClock(size_t fail_at) : fail_at_(fail_at) {}

  bool Read(double* seconds, ClockError* error) const override {
    size_t i = next_.fetch_add(1);
    if (i == fail_at_) {
      if (error) {
        *error = ClockError(ErrorCode::kNativeCallFailure,
                            "clock_gettime failed", EINVAL);
      }
      return false;
    }
    *seconds = static_cast<double>(i);
    return true;
  }

  Primitive Kind() const override { return Primitive::kClockGettime; }

 private:
  size_t fail_at_;
  mutable std::atomic<size_t> next_{0};
};

Options WithFakeClock(const HostInfo& host, std::vector<double> readings,
                      int* bind_calls = nullptr) {
  return Options::Builder()
      .Host(host)
      .Binder([readings, bind_calls](const ClockChoice& choice, ClockError*)
                  -> std::unique_ptr<NativeClock> {
        if (bind_calls) ++*bind_calls;
        return std::make_unique<FakeNativeClock>(readings, choice.primitive);
      })
      .Build();
}

}  // namespace

/**
 * @test ClockResolverTest.ResolvesRunningHost
 * @brief Default options resolve a working clock on a supported build.
 *
 * @expected Resolution is ok and two reads are non-decreasing.
 */
TEST(ClockResolverTest, ResolvesRunningHost) {
  Resolution r = ClockResolver().Resolve();
  ASSERT_TRUE(r.ok()) << r.error;
  EXPECT_TRUE(r.error.ok());
  EXPECT_FALSE(r.host.system.empty());

  double t1 = 0.0;
  double t2 = 0.0;
  ASSERT_TRUE(r.clock->Now(&t1));
  ASSERT_TRUE(r.clock->Now(&t2));
  EXPECT_GE(t2, t1);
}

/**
 * @test ClockResolverTest.UnsupportedPlatformIsFatal
 * @brief An unknown host fails before any binding is attempted.
 *
 * @expected kUnsupportedPlatform, no clock, binder never called.
 */
TEST(ClockResolverTest, UnsupportedPlatformIsFatal) {
  int bind_calls = 0;
  Resolution r =
      ClockResolver(WithFakeClock(HostInfo("plan9", "4"), {1.0}, &bind_calls))
          .Resolve();
  EXPECT_FALSE(r.ok());
  EXPECT_EQ(r.error.code, ErrorCode::kUnsupportedPlatform);
  EXPECT_TRUE(r.error.IsFatal());
  EXPECT_EQ(bind_calls, 0);
}

TEST(ClockResolverTest, UsesInjectedBinderAndChoice) {
  int bind_calls = 0;
  Resolution r = ClockResolver(WithFakeClock(HostInfo("linux", "2.4.20"),
                                             {10.0, 10.5, 11.0}, &bind_calls))
                     .Resolve();
  ASSERT_TRUE(r.ok()) << r.error;
  EXPECT_EQ(bind_calls, 1);
  EXPECT_EQ(r.clock->Choice().clock_id, 1);

  // The self-test consumed 10.0 and 10.5.
  double t = 0.0;
  ASSERT_TRUE(r.clock->Now(&t));
  EXPECT_DOUBLE_EQ(t, 11.0);
}

/**
 * @test ClockResolverTest.BackwardsClockFailsSelfTest
 * @brief A primitive whose second reading is smaller is rejected.
 */
TEST(ClockResolverTest, BackwardsClockFailsSelfTest) {
  Resolution r =
      ClockResolver(WithFakeClock(HostInfo("linux", "5.10.0"), {2.0, 1.0}))
          .Resolve();
  EXPECT_FALSE(r.ok());
  EXPECT_EQ(r.error.code, ErrorCode::kSanityCheckFailure);
  EXPECT_NE(r.error.message.find("not monotonic"), std::string::npos);
}

TEST(ClockResolverTest, EqualReadingsPassSelfTest) {
  Resolution r =
      ClockResolver(WithFakeClock(HostInfo("darwin", "23.1.0"), {5.0, 5.0}))
          .Resolve();
  EXPECT_TRUE(r.ok()) << r.error;
}

TEST(ClockResolverTest, FailingReadFailsSelfTest) {
  auto opts = Options::Builder()
                  .Host(HostInfo("linux", "5.10.0"))
                  .Binder([](const ClockChoice&, ClockError*)
                              -> std::unique_ptr<NativeClock> {
                    return std::make_unique<FailingNativeClock>();
                  })
                  .Build();
  Resolution r = ClockResolver(opts).Resolve();
  EXPECT_FALSE(r.ok());
  EXPECT_EQ(r.error.code, ErrorCode::kSanityCheckFailure);
  EXPECT_EQ(r.error.native_code, EINVAL);
}

/**
 * @test ClockResolverTest.BinderErrorIsBindingFailure
 * @brief A binder that cannot attach the primitive fails resolution.
 *
 * @expected kBindingFailure carrying the binder's message and native code.
 */
TEST(ClockResolverTest, BinderErrorIsBindingFailure) {
  auto opts =
      Options::Builder()
          .Host(HostInfo("linux", "5.10.0"))
          .Binder([](const ClockChoice&,
                     ClockError* err) -> std::unique_ptr<NativeClock> {
            *err = ClockError(ErrorCode::kBindingFailure,
                              "clock_getres(4) failed", EINVAL);
            return nullptr;
          })
          .Build();
  Resolution r = ClockResolver(opts).Resolve();
  EXPECT_FALSE(r.ok());
  EXPECT_EQ(r.error.code, ErrorCode::kBindingFailure);
  EXPECT_EQ(r.error.native_code, EINVAL);
  EXPECT_EQ(r.error.message, "clock_getres(4) failed");

  auto silent = Options::Builder(opts)
                    .Binder([](const ClockChoice&, ClockError*)
                                -> std::unique_ptr<NativeClock> {
                      return nullptr;
                    })
                    .Build();
  Resolution r2 = ClockResolver(silent).Resolve();
  EXPECT_EQ(r2.error.code, ErrorCode::kBindingFailure);
  EXPECT_NE(r2.error.message.find("CLOCK_MONOTONIC_RAW"), std::string::npos);
}

/**
 * @test ClockResolverTest.MismatchedPrimitiveIsBindingFailure
 * @brief A binder must return the primitive that was selected.
 *
 * @steps
 * 1. Select clock_gettime for a Linux host.
 * 2. Bind a clock that reports mach_absolute_time.
 *
 * @expected kBindingFailure naming both primitives, no clock.
 */
TEST(ClockResolverTest, MismatchedPrimitiveIsBindingFailure) {
  auto opts = Options::Builder()
                  .Host(HostInfo("linux", "5.10.0"))
                  .Binder([](const ClockChoice&, ClockError*)
                              -> std::unique_ptr<NativeClock> {
                    return std::make_unique<FakeNativeClock>(
                        std::vector<double>{1.0, 2.0},
                        Primitive::kMachAbsoluteTime);
                  })
                  .Build();
  Resolution r = ClockResolver(opts).Resolve();
  EXPECT_FALSE(r.ok());
  EXPECT_EQ(r.error.code, ErrorCode::kBindingFailure);
  EXPECT_NE(r.error.message.find("MachAbsoluteTime"), std::string::npos);
  EXPECT_NE(r.error.message.find("ClockGettime"), std::string::npos);
}

/**
 * @test ClockResolverTest.NowReportsAndThenClearsReadFailure
 * @brief A failed read reaches the caller; the next good read resets it.
 *
 * @steps
 * 1. Resolve a clock whose third read (first after the self-test) fails.
 * 2. Call Now() twice with the same ClockError.
 *
 * @expected
 * - First call: false, kNativeCallFailure/EINVAL, seconds untouched.
 * - Second call: true and the error record is ok again.
 */
TEST(ClockResolverTest, NowReportsAndThenClearsReadFailure) {
  auto opts = Options::Builder()
                  .Host(HostInfo("linux", "5.10.0"))
                  .Binder([](const ClockChoice&, ClockError*)
                              -> std::unique_ptr<NativeClock> {
                    return std::make_unique<OneFailureNativeClock>(2);
                  })
                  .Build();
  Resolution r = ClockResolver(opts).Resolve();
  ASSERT_TRUE(r.ok()) << r.error;

  double t = -7.0;
  ClockError err;
  EXPECT_FALSE(r.clock->Now(&t, &err));
  EXPECT_EQ(err.code, ErrorCode::kNativeCallFailure);
  EXPECT_EQ(err.native_code, EINVAL);
  EXPECT_DOUBLE_EQ(t, -7.0);

  EXPECT_TRUE(r.clock->Now(&t, &err));
  EXPECT_TRUE(err.ok()) << err;
  EXPECT_DOUBLE_EQ(t, 3.0);
}

/**
 * @test ClockResolverTest.ForeignPrimitiveFailsToBind
 * @brief A choice for another platform cannot bind in this build.
 */
TEST(ClockResolverTest, ForeignPrimitiveFailsToBind) {
#if defined(__APPLE__)
  HostInfo foreign("linux", "5.10.0");
#else
  HostInfo foreign("darwin", "23.1.0");
#endif
  Resolution r =
      ClockResolver(Options::Builder().Host(foreign).Build()).Resolve();
  EXPECT_FALSE(r.ok());
  EXPECT_EQ(r.error.code, ErrorCode::kBindingFailure);
}

TEST(ClockResolverTest, LogsSelection) {
  std::vector<std::string> lines;
  auto opts = Options::Builder(WithFakeClock(HostInfo("openbsd7", "7.4"),
                                             {1.0, 2.0}))
                  .LogSink([&lines](const std::string& s) {
                    lines.push_back(s);
                  })
                  .Build();
  Resolution r = ClockResolver(opts).Resolve();
  ASSERT_TRUE(r.ok()) << r.error;
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_NE(lines[0].find("system=openbsd7"), std::string::npos);
  EXPECT_NE(lines[1].find("selected"), std::string::npos);
  EXPECT_NE(lines[1].find("id=3"), std::string::npos);
}

TEST(ClockErrorTest, Formatting) {
  EXPECT_STREQ(monoclock::ErrorCodeName(ErrorCode::kSanityCheckFailure),
               "SanityCheckFailure");
  std::string s = monoclock::FormatErrno("clock_gettime failed", EINVAL);
  EXPECT_NE(s.find("errno " + std::to_string(EINVAL)), std::string::npos);

  std::ostringstream oss;
  oss << ClockError(ErrorCode::kNativeCallFailure, s, EINVAL);
  EXPECT_EQ(oss.str().find("NativeCallFailure: clock_gettime failed"), 0u);

  EXPECT_FALSE(ClockError(ErrorCode::kNativeCallFailure, s).IsFatal());
  EXPECT_TRUE(ClockError().ok());
}
