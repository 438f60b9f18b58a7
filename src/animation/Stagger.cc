// SPDX-License-Identifier: MIT
#include "Stagger.hh"

#include <algorithm>

namespace Stagger {

float itemDurationWithin(float itemDuration, float totalBudget) {
    return std::clamp(itemDuration, 0.f, std::max(0.f, totalBudget));
}

std::vector<float> delays(size_t itemCount, float itemDuration, float totalBudget, Direction direction) {
    std::vector<float> result(itemCount, 0.f);
    if (itemCount < 2)
        return result;

    float perItemGap = std::max(0.f, totalBudget - itemDuration) / float(itemCount - 1);
    for (size_t i = 0; i < itemCount; ++i) {
        auto slot = direction == Direction::Forward ? i : itemCount - 1 - i;
        result[i] = float(slot) * perItemGap;
    }
    return result;
}

}
