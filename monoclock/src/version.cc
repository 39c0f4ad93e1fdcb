// Copyright (c) 2025 The monoclock Authors
/**
 * @file version.cc
 * @brief Dotted numeric version parsing and comparison.
 */
#include "monoclock/version.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace monoclock {

namespace {
constexpr uint64_t kMaxComponent = 0xFFFFFFFFu;

bool IsDigit(char c) { return c >= '0' && c <= '9'; }
}  // namespace

std::string LeadingVersion(const std::string& release) {
  size_t n = 0;
  while (n < release.size() && (IsDigit(release[n]) || release[n] == '.')) {
    ++n;
  }
  return release.substr(0, n);
}

bool ParseVersion(const std::string& text, std::vector<uint32_t>* components) {
  components->clear();
  if (text.empty()) return false;

  uint64_t value = 0;
  size_t digits = 0;
  for (size_t i = 0; i <= text.size(); ++i) {
    if (i == text.size() || text[i] == '.') {
      if (digits == 0) {
        components->clear();
        return false;  // "", "4..1", "4.15."
      }
      components->push_back(static_cast<uint32_t>(value));
      value = 0;
      digits = 0;
      continue;
    }
    if (!IsDigit(text[i])) {
      components->clear();
      return false;
    }
    value = value * 10 + static_cast<uint64_t>(text[i] - '0');
    if (value > kMaxComponent) {
      components->clear();
      return false;
    }
    ++digits;
  }

  // "4.15.0" and "4.15" name the same release.
  while (components->size() > 1 && components->back() == 0) {
    components->pop_back();
  }
  return true;
}

int CompareVersions(const std::vector<uint32_t>& a,
                    const std::vector<uint32_t>& b) {
  const size_t n = std::max(a.size(), b.size());
  for (size_t i = 0; i < n; ++i) {
    uint32_t lhs = i < a.size() ? a[i] : 0;
    uint32_t rhs = i < b.size() ? b[i] : 0;
    if (lhs != rhs) return lhs < rhs ? -1 : 1;
  }
  return 0;
}

int CompareVersions(const std::string& a, const std::string& b) {
  std::vector<uint32_t> va;
  std::vector<uint32_t> vb;
  if (!ParseVersion(a, &va)) va.clear();
  if (!ParseVersion(b, &vb)) vb.clear();
  return CompareVersions(va, vb);
}

}  // namespace monoclock
