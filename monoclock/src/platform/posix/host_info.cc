// Copyright (c) 2025 The monoclock Authors
/**
 * @file host_info.cc (POSIX)
 * @brief uname(2)-based host detection for Linux, BSD, Solaris, Apple and
 * Cygwin builds.
 */
#include <sys/utsname.h>

#include <cctype>
#include <string>

#include "monoclock/clock_selector.hpp"

namespace monoclock {
namespace platform {

namespace {

std::string ToLower(const char* s) {
  std::string out(s);
  for (char& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

std::string LeadingDigits(const std::string& s) {
  size_t n = 0;
  while (n < s.size() && std::isdigit(static_cast<unsigned char>(s[n]))) ++n;
  return s.substr(0, n);
}

}  // namespace

HostInfo DetectHost() {
  utsname u{};
  if (uname(&u) != 0) {
    return HostInfo();
  }

  std::string system = ToLower(u.sysname);
  std::string release(u.release);

  if (system.compare(0, 6, "cygwin") == 0) {
    // "CYGWIN_NT-10.0-19045"
    system = "cygwin";
  } else if (system == "sunos") {
    // Solaris 11 reports SunOS 5.11
    system += LeadingDigits(release);
  }
  return HostInfo(system, release);
}

}  // namespace platform
}  // namespace monoclock
