// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file concepts.h
/// @brief C++20 Concepts for type constraints in pretty_diff.
///
/// This file provides concepts for compile-time type checking of:
/// - Scalar payloads accepted by the Value factories
/// - External log sinks accepted by LogPrinter / log_diff()
///
/// @note Requires C++20 or later.

#pragma once

#include <concepts>
#include <cstdint>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>

namespace pretty_diff {

// ============================================================
// Scalar Payload Concepts
// ============================================================

/// Signed integers stored in an int-kind Value (bool excluded)
template<typename T>
concept SignedPayload = std::is_integral_v<std::decay_t<T>> &&
                        std::is_signed_v<std::decay_t<T>> &&
                        !std::is_same_v<std::decay_t<T>, bool>;

/// Unsigned integers stored in a uint-kind Value (bool excluded)
template<typename T>
concept UnsignedPayload = std::is_integral_v<std::decay_t<T>> &&
                          std::is_unsigned_v<std::decay_t<T>> &&
                          !std::is_same_v<std::decay_t<T>, bool>;

/// Floating-point payloads (float32/float64 kinds)
template<typename T>
concept FloatPayload = std::is_floating_point_v<std::decay_t<T>>;

/// String-like types that can be converted to std::string
template<typename T>
concept StringLike = std::is_same_v<std::decay_t<T>, std::string> ||
                     std::is_same_v<std::decay_t<T>, const char*> ||
                     std::is_convertible_v<T, std::string_view>;

// ============================================================
// Log Sink Concepts
// ============================================================

/// An external sink that accepts one already formatted record per call.
/// DebugLogger satisfies it; so does any test double with log(string_view).
template<typename T>
concept FormattedLogSink = requires(T& sink, std::string_view line) {
    sink.log(line);
};

/// A FormattedLogSink that can also attribute the record to a call site
template<typename T>
concept LocatedLogSink = FormattedLogSink<T> &&
    requires(T& sink, std::string_view line, std::source_location loc) {
        sink.log(line, loc);
    };

} // namespace pretty_diff
