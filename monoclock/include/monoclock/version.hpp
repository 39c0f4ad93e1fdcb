// Copyright (c) 2025 The monoclock Authors
/**
 * @file version.hpp
 * @brief Dotted numeric version helpers used to gate Linux clock selection.
 */
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "monoclock/export.hpp"

namespace monoclock {

/**
 * @brief Returns the leading run of digits and dots of an OS release string.
 *
 * "4.15.0-112-generic" -> "4.15.0", "5.10.0-amd64" -> "5.10.0".
 * Returns an empty string if the release does not start with a digit or dot.
 */
MONOCLOCK_API std::string LeadingVersion(const std::string& release);

/**
 * @brief Parses a dotted numeric version.
 *
 * Trailing zero components are stripped ("4.15.0" -> {4, 15}, "0.0" -> {0}).
 *
 * @param text Version such as "2.6.28".
 * @param components Output components (cleared first).
 * @return false if @p text is empty or has an empty, non-numeric or
 *         out-of-range component.
 */
MONOCLOCK_API bool ParseVersion(const std::string& text,
                                std::vector<uint32_t>* components);

/**
 * @brief Compares two parsed versions component by component.
 *
 * Missing trailing components compare as zero.
 * @return negative if a < b, zero if equal, positive if a > b.
 */
MONOCLOCK_API int CompareVersions(const std::vector<uint32_t>& a,
                                  const std::vector<uint32_t>& b);

/**
 * @brief Compares two dotted version strings numerically.
 *
 * "2.6.5" < "2.6.28" and "4.15.0" == "4.15". An operand that fails
 * ParseVersion() compares as version 0.
 */
MONOCLOCK_API int CompareVersions(const std::string& a, const std::string& b);

}  // namespace monoclock
