// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file cycle_guard.h
/// @brief Visited-pair bookkeeping that stops the differ from looping.
///
/// Each side keeps its own map from an addressable value's Identity to the
/// Identity it was paired with on the other side. Revisiting a value with
/// the same partner means the subtree was already compared; revisiting it
/// with a different partner means the two graphs are shaped differently.
///
/// Only pointer targets and slice elements have an Identity; every cycle
/// through addressable storage passes through one of them. Cycles that pass
/// solely through map values, interface payloads or roots are not detected.

#pragma once

#include <pretty_diff/api.h>
#include <pretty_diff/value.h>

#include <tsl/robin_map.h>

#include <cstddef>
#include <functional>

namespace pretty_diff {

struct Identity {
    const void* address = nullptr;
    const Type* type = nullptr;

    bool operator==(const Identity&) const = default;
};

struct IdentityHash {
    std::size_t operator()(const Identity& id) const noexcept {
        auto h = std::hash<const void*>{}(id.address);
        return h ^ (std::hash<const void*>{}(id.type) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};

using VisitedSet = tsl::robin_map<Identity, Identity, IdentityHash>;

/// Identity of a view for which has_identity() holds
[[nodiscard]] inline Identity identity_of(const ValueRef& v) noexcept {
    return Identity{v.address(), v.type()};
}

class PRETTY_DIFF_API CycleGuard {
public:
    enum class Visit {
        First,            ///< never seen: compare the subtree
        Repeat,           ///< seen with the same partner: already compared
        LeftRevisited,    ///< left seen before with another partner
        RightRevisited,   ///< right seen before with another partner
    };

    /// Looks both identities up, then records them as mutual partners
    Visit enter(const Identity& left, const Identity& right);

    [[nodiscard]] const VisitedSet& left_visited() const noexcept { return left_; }
    [[nodiscard]] const VisitedSet& right_visited() const noexcept { return right_; }

private:
    VisitedSet left_;
    VisitedSet right_;
};

} // namespace pretty_diff
