// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file recdiff_config.h
/// @brief Centralized configuration for recdiff and its dependencies
///
/// This file defines the compile-time configuration for the third-party
/// libraries used by recdiff:
///   - immer: persistent containers backing the Value tree
///   - Boost.Locale: case folding and Unicode normalization of text
///
/// It MUST be included before any immer header. All recdiff public headers
/// include it first, so users of recdiff headers need nothing special.

#pragma once

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(RECDIFF_CONFIGURED)
#error "immer headers were included before recdiff/recdiff_config.h. " \
       "Please include recdiff headers before any direct immer includes."
#endif

#define RECDIFF_CONFIGURED 1

// ============================================================
// Immer Settings
//
// Thread safety stays at immer's default (atomic reference counts):
// Value trees and DiffOptions may be shared by concurrent diff runs.
// ============================================================

/// @brief Disable tagged node assertions (smaller nodes, no assertion overhead)
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

// ============================================================
// Boost Settings
// ============================================================

/// @brief Disable Boost auto-linking (MSVC); CMake links Boost::locale explicitly
#ifndef BOOST_ALL_NO_LIB
#define BOOST_ALL_NO_LIB 1
#endif

/// @brief Locale name used to generate the Boost.Locale locale for case
/// folding and NFC. Only the UTF-8 encoding part matters for those
/// conversions.
#ifndef RECDIFF_TEXT_LOCALE
#define RECDIFF_TEXT_LOCALE "en_US.UTF-8"
#endif

// ============================================================
// Verbose Logging
//
// When RECDIFF_VERBOSE_LOG is 1, failed lookups and errors raised by the
// diff engine are reported on stderr (see recdiff/log.h).
//
// Default: enabled in debug builds, disabled when NDEBUG is defined.
// ============================================================

#ifndef RECDIFF_VERBOSE_LOG
#  if defined(NDEBUG)
#    define RECDIFF_VERBOSE_LOG 0
#  else
#    define RECDIFF_VERBOSE_LOG 1
#  endif
#endif

#ifdef RECDIFF_CONFIG_VERBOSE
#if RECDIFF_VERBOSE_LOG
#pragma message("recdiff: verbose logging ENABLED")
#else
#pragma message("recdiff: verbose logging DISABLED")
#endif
#endif // RECDIFF_CONFIG_VERBOSE
