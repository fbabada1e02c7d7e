// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file deepdiff_config.h
/// @brief Centralized configuration for deepdiff and its dependencies
///
/// This file defines the compile-time configuration for the third-party
/// libraries used by deepdiff:
///   - immer: persistent vectors backing the patch history stacks
///   - boost: date_time (timestamps) and container_hash (content hashes)
///
/// It MUST be included before any library headers to ensure consistent settings.
/// All deepdiff public headers already include this file.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(DEEPDIFF_CONFIGURED)
#error "immer headers were included before deepdiff/deepdiff_config.h. " \
       "Please include deepdiff headers before any direct immer includes."
#endif

#define DEEPDIFF_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// @brief Disable thread safety for single-threaded performance
///
/// deepdiff runs every algorithm synchronously on the calling thread and the
/// history stacks are owned by one PatchHistory, so non-atomic reference
/// counting is sufficient.
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 1
#endif

/// @brief Disable tagged node assertions
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
// Boost Library Configuration
// ============================================================

/// @brief Disable Boost auto-linking for date_time library (MSVC)
///
/// deepdiff only uses the header-only parts of boost::posix_time.
#ifndef BOOST_DATE_TIME_NO_LIB
#define BOOST_DATE_TIME_NO_LIB 1
#endif

#ifndef BOOST_ALL_NO_LIB
#define BOOST_ALL_NO_LIB 1
#endif

// ============================================================
// Verbose Logging
//
// When DEEPDIFF_VERBOSE_LOG is non-zero, patch failures and usage errors
// are reported on stderr before the exception is thrown.
//
// Default: enabled in debug builds, disabled when NDEBUG is defined.
// ============================================================

#ifndef DEEPDIFF_VERBOSE_LOG
#  if defined(NDEBUG)
#    define DEEPDIFF_VERBOSE_LOG 0
#  else
#    define DEEPDIFF_VERBOSE_LOG 1
#  endif
#endif

// ============================================================
// Configuration Summary (compile-time message)
// ============================================================

#ifdef DEEPDIFF_CONFIG_VERBOSE
#if IMMER_NO_THREAD_SAFETY
#pragma message("deepdiff: immer thread safety DISABLED (single-thread history)")
#else
#pragma message("deepdiff: immer thread safety ENABLED")
#endif

#if DEEPDIFF_VERBOSE_LOG
#pragma message("deepdiff: verbose logging ENABLED")
#endif
#endif // DEEPDIFF_CONFIG_VERBOSE
