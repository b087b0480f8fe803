#pragma once

/**
 * @file require_cpp23.hpp
 * @brief C++23 feature-test checks for jsondelta
 *
 * Include early in a translation unit (main.cpp does) to get a clear
 * diagnostic when the toolchain is too old.
 *
 * Required compiler versions:
 *   - GCC 14.0+
 *   - Clang 19.0+
 */

#include <version>

// =============================================================================
// C++23 Language Standard Check
// =============================================================================

#if !defined(__cplusplus) || __cplusplus < 202'302L
    #error "jsondelta requires C++23 or later (__cplusplus >= 202302L)."
#endif

// =============================================================================
// std::expected (__cpp_lib_expected)
// =============================================================================
// Required for: Error handling (Result / VoidResult)

#if !defined(__cpp_lib_expected) || __cpp_lib_expected < 202'202L
    #error "jsondelta requires std::expected (__cpp_lib_expected >= 202202L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// =============================================================================
// std::print / std::println (__cpp_lib_print)
// =============================================================================
// Required for: CLI output

#if !defined(__cpp_lib_print) || __cpp_lib_print < 202'207L
    #error "jsondelta requires std::print/std::println (__cpp_lib_print >= 202207L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// =============================================================================
// std::format (__cpp_lib_format)
// =============================================================================
// Required for: Error messages and JSON paths

#if !defined(__cpp_lib_format) || __cpp_lib_format < 202'110L
    #error "jsondelta requires std::format (__cpp_lib_format >= 202110L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// =============================================================================
// std::views::enumerate (__cpp_lib_ranges_enumerate)
// =============================================================================
// Required for: Indexed iteration over arrays and CLI arguments

#if !defined(__cpp_lib_ranges_enumerate) || __cpp_lib_ranges_enumerate < 202'302L
    #error "jsondelta requires std::views::enumerate (__cpp_lib_ranges_enumerate >= 202302L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

#define JSONDELTA_CPP23_FEATURES_VERIFIED 1
