// SPDX-License-Identifier: MIT
#include "AnimatorManager.hh"

#include <algorithm>

void AnimatorManager::updateAllAnimators(float deltaSeconds) {
    if (mPaused)
        return;

    // callbacks may start new animators, those get their first update next frame
    auto count = mActiveAnimators.size();
    auto it = mActiveAnimators.begin();
    for (size_t i = 0; i < count; ++i, ++it)
    {
        auto &anim = *it;
        if (!anim->cancelled)
            anim->update(deltaSeconds);
    }

    mActiveAnimators.remove_if([](const std::shared_ptr<AbstractAnimator> &anim) {
        return anim->cancelled || (anim->finished && !anim->loop);
    });
}

void AnimatorManager::start(std::shared_ptr<AbstractAnimator> animator) {
    animator->reset();
    mActiveAnimators.emplace_back(std::move(animator));
}

void AnimatorManager::stop(const std::shared_ptr<AbstractAnimator> &animator) {
    animator->cancel();
}

void AnimatorManager::stopAll() {
    for (const auto &anim : mActiveAnimators)
        anim->cancel();
}

size_t AnimatorManager::activeCount() const {
    return std::count_if(mActiveAnimators.begin(), mActiveAnimators.end(), [](const std::shared_ptr<AbstractAnimator> &anim) {
        return !anim->cancelled && !(anim->finished && !anim->loop);
    });
}
