/**
 * @file Platform.hpp
 * @brief Compile-time compiler detection and branch-prediction hints.
 *
 * @author InjSense Team
 * @version 0.1.0
 * @date 2026-10-16
 * @copyright MIT License
 */
#pragma once

#ifndef INJSENSE_CORE_PLATFORM_HPP
    #define INJSENSE_CORE_PLATFORM_HPP

// ---- Compiler ------------------------------------------------------------

    #if defined(__clang__)
        #define INJSENSE_COMPILER_CLANG 1
    #elif defined(__GNUC__)
        #define INJSENSE_COMPILER_GCC   1
    #elif defined(_MSC_VER)
        #define INJSENSE_COMPILER_MSVC  1
    #else
        #define INJSENSE_COMPILER_UNKNOWN 1
    #endif

// ---- Intrinsics ----------------------------------------------------------

    #if defined(INJSENSE_COMPILER_GCC) || defined(INJSENSE_COMPILER_CLANG)
        #define INJSENSE_LIKELY(x)      __builtin_expect(!!(x), 1)
        #define INJSENSE_UNLIKELY(x)    __builtin_expect(!!(x), 0)
    #else
        #define INJSENSE_LIKELY(x)      (x)
        #define INJSENSE_UNLIKELY(x)    (x)
    #endif

#endif // INJSENSE_CORE_PLATFORM_HPP
