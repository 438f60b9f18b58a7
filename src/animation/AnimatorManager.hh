// SPDX-License-Identifier: MIT
#pragma once

#include <list>
#include <memory>
#include "Animator.hh"

/// Task list of running animators, polled once per frame.
/// Finished and cancelled animators are dropped during the update that sees them.
class AnimatorManager
{
    std::list<std::shared_ptr<AbstractAnimator>> mActiveAnimators;
    bool mPaused = false;
public:
    void updateAllAnimators(float deltaSeconds);
    void start(std::shared_ptr<AbstractAnimator> animator);
    /// cancels, the animator is released on the next update
    void stop(const std::shared_ptr<AbstractAnimator> &animator);
    /// cancels all, safe from inside an animator callback
    void stopAll();
    size_t activeCount() const;

    /// a paused manager ignores updates, animators keep their progress
    void setPaused(bool paused) {mPaused = paused;}
    bool isPaused() const {return mPaused;}
};
