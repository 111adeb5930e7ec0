#pragma once

/**
 * @file require_cpp23.hpp
 * @brief C++23 feature-test macros for jsonassert
 *
 * Include this header early in a translation unit (the CLI's main.cpp does)
 * to get a clear error message when the toolchain is too old.
 *
 * Required compiler versions:
 *   - GCC 14.0+
 *   - Clang 19.0+
 */

#include <expected>
#include <version>

#if !defined(__cplusplus) || __cplusplus < 202'302L
    #error "jsonassert requires C++23 or later (__cplusplus >= 202302L)."
#endif

// std::print / std::println: CLI output
#if !defined(__cpp_lib_print) || __cpp_lib_print < 202'207L
    #error "jsonassert requires std::print/std::println (__cpp_lib_print >= 202207L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// std::expected: Result / VoidResult
#if !defined(__cpp_lib_expected) || __cpp_lib_expected < 202'202L
    #error "jsonassert requires std::expected (__cpp_lib_expected >= 202202L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// std::views::enumerate: indexed iteration over arguments and cases
#if !defined(__cpp_lib_ranges_enumerate) || __cpp_lib_ranges_enumerate < 202'302L
    #error "jsonassert requires std::views::enumerate (__cpp_lib_ranges_enumerate >= 202302L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// std::format: report rendering
#if !defined(__cpp_lib_format) || __cpp_lib_format < 202'110L
    #error "jsonassert requires std::format (__cpp_lib_format >= 202110L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

#define JSONASSERT_CPP23_FEATURES_VERIFIED 1
