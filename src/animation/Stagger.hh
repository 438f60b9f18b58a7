// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <vector>

namespace Stagger {

enum class Direction {
    Forward,
    Reverse
};

/// a budget of zero (or less) means every state change happens synchronously
inline bool isInstantaneous(float totalBudget) {
    return totalBudget <= 0.f;
}

/// per-item duration clamped so the last item still ends inside the budget
float itemDurationWithin(float itemDuration, float totalBudget);

/// Start delays for `itemCount` items spread over `totalBudget` seconds.
/// Forward: item 0 starts at 0 and the last one at `totalBudget - itemDuration`.
/// Reverse is the mirror image, item 0 starts last.
std::vector<float> delays(size_t itemCount, float itemDuration, float totalBudget, Direction direction);

}
