/**
 * @file format.hpp
 * @brief Compatibility header for std::format vs fmt::format
 *
 * Detection is based on the __cpp_lib_format feature test macro. When the
 * standard library does not provide <format>, the fmt library is used.
 *
 * Usage:
 *   #include <kretz/compat/format.hpp>
 *   auto s = kretz::compat::format("dimensions={}x{}x{}", x, y, z);
 */

#pragma once

#include <version>  // For feature test macros

#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define KRETZ_HAS_STD_FORMAT 1
#elif defined(__APPLE__) && defined(__clang__) && __clang_major__ >= 15
    // Apple Clang 15+ with libc++ supports std::format
    #define KRETZ_HAS_STD_FORMAT 1
#elif defined(_MSC_VER) && _MSC_VER >= 1929 && defined(_HAS_CXX20) && _HAS_CXX20
    #define KRETZ_HAS_STD_FORMAT 1
#else
    #define KRETZ_HAS_STD_FORMAT 0
#endif

#if KRETZ_HAS_STD_FORMAT
    #include <format>
    namespace kretz::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    #include <fmt/format.h>
    namespace kretz::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif
