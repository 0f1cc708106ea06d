#pragma once

/**
 * @file require_cpp23.hpp
 * @brief C++23 library features reposlice depends on
 *
 * Include early in a translation unit to get one clear message per missing
 * feature instead of a cascade of template errors.
 *
 * Required compiler versions:
 *   - GCC 14.0+
 *   - Clang 19.0+
 */

#include <expected>
#include <version>

#if !defined(__cplusplus) || __cplusplus < 202'302L
    #error "reposlice requires C++23 or later (__cplusplus >= 202302L)."
#endif

// Console output of the CLI
#if !defined(__cpp_lib_print) || __cpp_lib_print < 202'207L
    #error "reposlice requires std::print/std::println (__cpp_lib_print >= 202207L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// Result<T> error handling
#if !defined(__cpp_lib_expected) || __cpp_lib_expected < 202'202L
    #error "reposlice requires std::expected (__cpp_lib_expected >= 202202L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// Indexed iteration over parameters, call sites and seeds
#if !defined(__cpp_lib_ranges_enumerate) || __cpp_lib_ranges_enumerate < 202'302L
    #error "reposlice requires std::views::enumerate (__cpp_lib_ranges_enumerate >= 202302L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

#if !defined(__cpp_lib_format) || __cpp_lib_format < 202'110L
    #error "reposlice requires std::format (__cpp_lib_format >= 202110L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

#if !defined(__cpp_lib_ranges) || __cpp_lib_ranges < 202'110L
    #error "reposlice requires std::ranges (__cpp_lib_ranges >= 202110L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

#define REPOSLICE_CPP23_FEATURES_VERIFIED 1
