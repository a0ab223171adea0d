/**
 * @file Platform.hpp
 * @brief Compile-time compiler detection and branch-prediction macros.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef SPX_CORE_PLATFORM_HPP
    #define SPX_CORE_PLATFORM_HPP

// ---- Compiler ------------------------------------------------------------

    #if defined(__clang__)
        #define SPX_COMPILER_CLANG 1
    #elif defined(__GNUC__)
        #define SPX_COMPILER_GCC   1
    #elif defined(_MSC_VER)
        #define SPX_COMPILER_MSVC  1
    #else
        #define SPX_COMPILER_UNKNOWN 1
    #endif

// ---- Intrinsics ----------------------------------------------------------

    #if defined(SPX_COMPILER_GCC) || defined(SPX_COMPILER_CLANG)
        #define SPX_LIKELY(x)       __builtin_expect(!!(x), 1)
        #define SPX_UNLIKELY(x)     __builtin_expect(!!(x), 0)
    #elif defined(SPX_COMPILER_MSVC)
        #define SPX_LIKELY(x)       (x)
        #define SPX_UNLIKELY(x)     (x)
    #else
        #define SPX_LIKELY(x)       (x)
        #define SPX_UNLIKELY(x)     (x)
    #endif

#endif // SPX_CORE_PLATFORM_HPP
