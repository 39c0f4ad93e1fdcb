// Copyright (c) 2025 The monoclock Authors
/**
 * @file clock_selector.cc
 * @brief Platform identifier to native primitive mapping.
 */
#include "monoclock/clock_selector.hpp"

#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

#include "monoclock/version.hpp"

namespace monoclock {

namespace {

bool StartsWith(const std::string& s, const char* prefix) {
  return s.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

ClockChoice MakeGettimeChoice(ClockKind kind, int clock_id) {
  ClockChoice c;
  c.primitive = Primitive::kClockGettime;
  c.kind = kind;
  c.clock_id = clock_id;
  c.description = kind == ClockKind::kMonotonicRaw
                      ? "clock_gettime(CLOCK_MONOTONIC_RAW)"
                      : "clock_gettime(CLOCK_MONOTONIC)";
  return c;
}

void Fail(ClockError* error, const std::string& msg) {
  if (error) {
    *error = ClockError(ErrorCode::kUnsupportedPlatform, msg);
  }
}

}  // namespace

bool SelectClock(const HostInfo& host, ClockChoice* choice,
                 ClockError* error) {
  const std::string& sys = host.system;

  if (StartsWith(sys, "darwin")) {  // macOS, iOS
    choice->primitive = Primitive::kMachAbsoluteTime;
    choice->kind = ClockKind::kMonotonic;
    choice->clock_id = -1;
    choice->description = "mach_absolute_time()";
    return true;
  }

  if (StartsWith(sys, "win32") || StartsWith(sys, "cygwin")) {
    choice->primitive = Primitive::kTickCount64;
    choice->kind = ClockKind::kMonotonic;
    choice->clock_id = -1;
    choice->description = "GetTickCount64()";
    return true;
  }

  if (StartsWith(sys, "linux")) {
    std::vector<uint32_t> release;
    std::vector<uint32_t> threshold;
    if (!ParseVersion(LeadingVersion(host.release), &release) ||
        !ParseVersion(kLinuxRawClockThreshold, &threshold)) {
      Fail(error, "cannot parse kernel release '" + host.release + "'");
      return false;
    }
    if (CompareVersions(release, threshold) > 0) {
      *choice = MakeGettimeChoice(ClockKind::kMonotonicRaw,
                                  kLinuxClockMonotonicRaw);
    } else {
      *choice = MakeGettimeChoice(ClockKind::kMonotonic, kLinuxClockMonotonic);
    }
    return true;
  }

  if (StartsWith(sys, "freebsd")) {
    *choice = MakeGettimeChoice(ClockKind::kMonotonic, kFreeBsdClockMonotonic);
    return true;
  }

  if (StartsWith(sys, "sunos5")) {
    *choice = MakeGettimeChoice(ClockKind::kMonotonic, kSolarisClockMonotonic);
    return true;
  }

  if (sys.find("bsd") != std::string::npos) {  // OpenBSD, NetBSD
    *choice = MakeGettimeChoice(ClockKind::kMonotonic, kBsdClockMonotonic);
    return true;
  }

  Fail(error, "no monotonic clock known for platform '" + sys + "'");
  return false;
}

const char* PrimitiveName(Primitive primitive) {
  switch (primitive) {
    case Primitive::kNone:
      return "None";
    case Primitive::kMachAbsoluteTime:
      return "MachAbsoluteTime";
    case Primitive::kTickCount64:
      return "TickCount64";
    case Primitive::kClockGettime:
      return "ClockGettime";
  }
  return "Unknown";
}

std::ostream& operator<<(std::ostream& os, const HostInfo& h) {
  os << "system=" << (h.system.empty() ? "?" : h.system)
     << ", release=" << (h.release.empty() ? "?" : h.release);
  return os;
}

std::ostream& operator<<(std::ostream& os, const ClockChoice& c) {
  os << PrimitiveName(c.primitive);
  if (!c.description.empty()) {
    os << " [" << c.description << "]";
  }
  if (c.primitive == Primitive::kClockGettime) {
    os << " id=" << c.clock_id;
  }
  return os;
}

}  // namespace monoclock
