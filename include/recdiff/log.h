// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file log.h
/// @brief Diagnostic logging helpers.
///
/// Messages go to stderr with the caller's source location, and compile to
/// nothing unless RECDIFF_VERBOSE_LOG is 1 (see recdiff_config.h).

#pragma once

#include <recdiff/recdiff_config.h>

#include <cstddef>
#include <iostream>
#include <source_location>
#include <string_view>

namespace recdiff {

namespace detail {

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if RECDIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << key << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)key;
    (void)reason;
    (void)loc;
#endif
}

inline void log_index_error(
    std::string_view func,
    std::size_t index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if RECDIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] index " << index << " " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)index;
    (void)reason;
    (void)loc;
#endif
}

/// Report an error that is about to be thrown out of the diff engine
inline void log_diff_error(
    std::string_view func,
    std::string_view what,
    std::source_location loc = std::source_location::current()) noexcept
{
#if RECDIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] " << what
              << " (raised at " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)what;
    (void)loc;
#endif
}

} // namespace detail

} // namespace recdiff
