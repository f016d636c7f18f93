// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file key_match.h
/// @brief Structural equality for map keys and map key partitioning.
///
/// Map keys may have any comparable type (structs, arrays, interfaces...),
/// so entries are paired with a pairwise scan instead of a hash lookup.
/// O(|left| x |right|) comparisons; fine for debug output.

#pragma once

#include <pretty_diff/api.h>
#include <pretty_diff/value.h>

#include <utility>
#include <vector>

namespace pretty_diff {

/// Key equality (not value equality): bool, int, uint, float, complex,
/// string by value; array and struct element-wise; pointer, chan and
/// unsafe pointer by address; interface by its dynamic value.
/// Two absent values are equal; values of different types are not.
///
/// @throws InvalidMapKeyError when a slice, map or func is compared
[[nodiscard]] PRETTY_DIFF_API bool key_equal(const ValueRef& a, const ValueRef& b);

struct KeyPartition {
    std::vector<MapEntryRef> only_left;
    std::vector<std::pair<MapEntryRef, MapEntryRef>> both;  ///< left entry, first equal right entry
    std::vector<MapEntryRef> only_right;
};

/// Partitions the entries of two maps by key. Order follows the
/// insertion order of the respective map.
[[nodiscard]] PRETTY_DIFF_API KeyPartition key_diff(const ValueRef& a, const ValueRef& b);

} // namespace pretty_diff
