// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file diagnostics.h
/// @brief Error types and verbose logging helpers shared by all deepdiff modules.
///
/// Error taxonomy:
/// - UsageError: an internal extension point was called outside of its contract.
///   Always a programming error, never caught internally.
/// - PatchError: a Change could not be applied because its path does not resolve
///   against the target (see change.h). Declared there because it carries a Path.
///
/// Logging goes to stderr and is compiled in only when DEEPDIFF_VERBOSE_LOG is set
/// (see deepdiff_config.h).

#pragma once

#include <deepdiff/api.h>
#include <deepdiff/deepdiff_config.h>

#include <iostream>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

namespace deepdiff {

/// Thrown when a hook or accessor is used outside of its guaranteed context
class UsageError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

namespace detail {

inline void log_usage_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if DEEPDIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] usage error: " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_patch_error(
    std::string_view func,
    std::string_view path,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if DEEPDIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] path '" << path << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)path;
    (void)reason;
    (void)loc;
#endif
}

/// Log and throw a UsageError
[[noreturn]] inline void usage_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current())
{
    log_usage_error(func, message, loc);
    throw UsageError(std::string{func} + ": " + std::string{message});
}

} // namespace detail

} // namespace deepdiff
