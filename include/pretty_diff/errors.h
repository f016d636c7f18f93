// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file errors.h
/// @brief Exception types thrown by pretty_diff.
///
/// UnsupportedKindError and InvalidMapKeyError are programming errors: the
/// kind taxonomy is incomplete, or a value that can never be a map key
/// reached the key matcher. Nothing inside the library catches them.

#pragma once

#include <pretty_diff/api.h>

#include <stdexcept>
#include <string>

namespace pretty_diff {

class PRETTY_DIFF_API UnsupportedKindError : public std::logic_error {
public:
    explicit UnsupportedKindError(const std::string& kind_name)
        : std::logic_error("unsupported value kind: " + kind_name) {}
};

class PRETTY_DIFF_API InvalidMapKeyError : public std::logic_error {
public:
    explicit InvalidMapKeyError(const std::string& type_name)
        : std::logic_error("invalid map key type " + type_name) {}
};

/// Thrown by DebugLogger::flush() / append_file(); every failure of a single
/// append is merged into what(), separated by "; ".
class PRETTY_DIFF_API FileAppendError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace pretty_diff
