// Copyright (c) 2025 The monoclock Authors
/**
 * @file host_info.cc (Windows)
 * @brief Windows host detection.
 *
 * GetVersionEx reports the manifest-compatible version, so the release is
 * read with RtlGetVersion from ntdll instead.
 */
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>

#include <sstream>
#include <string>

#include "monoclock/clock_selector.hpp"

namespace monoclock {
namespace platform {

namespace {

using RtlGetVersionFn = LONG(WINAPI*)(OSVERSIONINFOW*);

std::string WindowsRelease() {
  HMODULE ntdll = GetModuleHandleW(L"ntdll.dll");
  if (ntdll == nullptr) return std::string();
  auto fn = reinterpret_cast<RtlGetVersionFn>(
      GetProcAddress(ntdll, "RtlGetVersion"));
  if (fn == nullptr) return std::string();

  OSVERSIONINFOW info{};
  info.dwOSVersionInfoSize = sizeof(info);
  if (fn(&info) != 0) return std::string();

  std::ostringstream oss;
  oss << info.dwMajorVersion << "." << info.dwMinorVersion << "."
      << info.dwBuildNumber;
  return oss.str();
}

}  // namespace

HostInfo DetectHost() { return HostInfo("win32", WindowsRelease()); }

}  // namespace platform
}  // namespace monoclock
