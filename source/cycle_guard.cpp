// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <pretty_diff/cycle_guard.h>

namespace pretty_diff {

CycleGuard::Visit CycleGuard::enter(const Identity& left, const Identity& right)
{
    Visit visit = Visit::First;

    if (auto it = left_.find(left); it != left_.end()) {
        visit = (it->second == right) ? Visit::Repeat : Visit::LeftRevisited;
    } else if (auto jt = right_.find(right); jt != right_.end()) {
        visit = (jt->second == left) ? Visit::Repeat : Visit::RightRevisited;
    }

    // Latest pairing wins, also after a mismatch
    left_.insert_or_assign(left, right);
    right_.insert_or_assign(right, left);
    return visit;
}

} // namespace pretty_diff
