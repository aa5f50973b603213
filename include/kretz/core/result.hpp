/**
 * @file result.hpp
 * @brief Result<T> type aliases and helpers for the Kretz reader
 *
 * This file provides standardized Result<T> types and error handling
 * utilities for the Kretz volume reader, integrating with common_system's
 * Result pattern.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace kretz {

/**
 * @brief Result type alias for reader operations
 * @tparam T The success value type
 */
template <typename T>
using Result = kcenon::common::Result<T>;

/**
 * @brief Result type for void operations
 */
using VoidResult = kcenon::common::VoidResult;

/**
 * @brief Error information type
 */
using error_info = kcenon::common::error_info;

/**
 * @namespace error_codes
 * @brief Kretz reader error codes
 *
 * Error code range: -700 to -799
 */
namespace error_codes {
    // Import common error codes
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int kretz_base = -700;

    // File access errors (-700 to -719)
    constexpr int file_not_found = kretz_base - 0;
    constexpr int file_read_error = kretz_base - 1;
    constexpr int not_a_regular_file = kretz_base - 2;

    // Format errors (-720 to -739)
    constexpr int invalid_signature = kretz_base - 20;
    constexpr int truncated_header = kretz_base - 21;

    // Volume errors (-740 to -759)
    constexpr int volume_too_large = kretz_base - 40;
    constexpr int payload_size_mismatch = kretz_base - 41;
    constexpr int volume_not_loaded = kretz_base - 42;
    constexpr int type_mismatch = kretz_base - 43;
} // namespace error_codes

// Re-export the success helper used for VoidResult
using kcenon::common::ok;

/**
 * @brief Create a reader error result with module context
 * @tparam T The result value type
 * @param code Error code from kretz::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> kretz_error(int code, const std::string& message,
                             const std::string& details = "") {
    if (details.empty()) {
        return kcenon::common::make_error<T>(code, message, "kretz");
    }
    return kcenon::common::make_error<T>(code, message, "kretz", details);
}

/**
 * @brief Create a reader void error result
 * @param code Error code from kretz::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return VoidResult containing the error
 */
inline VoidResult kretz_void_error(int code, const std::string& message,
                                   const std::string& details = "") {
    if (details.empty()) {
        return VoidResult(error_info{code, message, "kretz"});
    }
    return VoidResult(error_info{code, message, "kretz", details});
}

} // namespace kretz
