/**
 * @file version.hpp
 * @brief Library version information
 *
 * Version format: MAJOR.MINOR.PATCH
 * - MAJOR: Incompatible API changes
 * - MINOR: Backwards-compatible functionality additions
 * - PATCH: Backwards-compatible bug fixes
 */

#pragma once

#include <string>

namespace kretz {

inline constexpr const char* kVersionString = "0.1.0";

[[nodiscard]] inline auto version_string() -> std::string { return kVersionString; }

}  // namespace kretz
