// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file config.h
/// @brief Centralized compile-time configuration for pretty_diff and immer
///
/// This file defines the compile-time configuration for:
///   - immer: containers backing Value (vectors and boxes)
///   - pretty_diff diagnostics (verbose access log)
///   - DebugLogger defaults (line width, header window)
///
/// It MUST be included before any immer header. All pretty_diff public
/// headers include it first, so users who only include pretty_diff headers
/// don't need to do anything special.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(PRETTY_DIFF_CONFIGURED)
#error "immer headers were included before pretty_diff/config.h. " \
       "Please include pretty_diff headers before any direct immer includes."
#endif

#define PRETTY_DIFF_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// @brief Non-atomic reference counting and no locks.
///
/// The differ only reads through references and never copies boxes, so
/// independent diffs on different threads stay safe as long as the Value
/// trees themselves are not copied concurrently.
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 1
#endif

/// @brief Disable tagged node assertions (smaller nodes)
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
// Verbose Logging Configuration
//
// When PRETTY_DIFF_VERBOSE_LOG is 1:
//   - Value::at() / Value::field_or() log misuse to stderr
//
// Enabled by default in debug builds, disabled with NDEBUG.
// ============================================================

#ifndef PRETTY_DIFF_VERBOSE_LOG
#  if defined(NDEBUG)
#    define PRETTY_DIFF_VERBOSE_LOG 0
#  else
#    define PRETTY_DIFF_VERBOSE_LOG 1
#  endif
#endif

// ============================================================
// DebugLogger Defaults
// ============================================================

/// @brief Records longer than this many visible columns are wrapped
#ifndef PRETTY_DIFF_LOG_MAX_LINE_WIDTH
#define PRETTY_DIFF_LOG_MAX_LINE_WIDTH 80
#endif

/// @brief A new header is printed once this much time passed since the last flush
#ifndef PRETTY_DIFF_LOG_HEADER_WINDOW_MS
#define PRETTY_DIFF_LOG_HEADER_WINDOW_MS 2000
#endif

#ifdef PRETTY_DIFF_CONFIG_VERBOSE
#if IMMER_NO_THREAD_SAFETY
#pragma message("pretty_diff/immer: Thread safety DISABLED (optimized for single-thread)")
#else
#pragma message("pretty_diff/immer: Thread safety ENABLED")
#endif
#endif // PRETTY_DIFF_CONFIG_VERBOSE
