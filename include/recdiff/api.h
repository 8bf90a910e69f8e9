// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file api.h
/// @brief Cross-platform export/import macros for the recdiff library.
///
/// - Building recdiff as a SHARED library: CMake defines RECDIFF_EXPORTS
///   (private) and RECDIFF_SHARED (public); RECDIFF_API exports symbols.
/// - Using recdiff as a SHARED library: RECDIFF_SHARED is propagated by the
///   recdiff target, RECDIFF_API imports symbols.
/// - STATIC library: RECDIFF_API expands to nothing.

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #ifdef RECDIFF_SHARED
        #ifdef RECDIFF_EXPORTS
            #define RECDIFF_API __declspec(dllexport)
        #else
            #define RECDIFF_API __declspec(dllimport)
        #endif
    #else
        #define RECDIFF_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(RECDIFF_SHARED) && defined(RECDIFF_EXPORTS)
        #define RECDIFF_API __attribute__((visibility("default")))
    #else
        #define RECDIFF_API
    #endif
#else
    #define RECDIFF_API
#endif
