// SPDX-License-Identifier: MIT
#pragma once

#include <functional>
#include "Animator.hh"

/// Animates one float from `from` to `to`, starting after `delay` seconds.
/// Holds `from` during the delay, then eases into `to` over `duration`.
class Tween final : public Animator<FloatKeyFrame>
{
    float mFrom;
    float mTo;
    float mDelay;
    float mDuration;
    float mValue;
    std::function<void(float)> mOnUpdate;
    std::function<void()> mOnComplete;

public:
    Tween(float from, float to, float delay, float duration, AnimationEasing easing);

    Tween &onUpdate(std::function<void(float)> callback) {
        mOnUpdate = std::move(callback);
        return *this;
    }
    Tween &onComplete(std::function<void()> callback) {
        mOnComplete = std::move(callback);
        return *this;
    }

    void update(float deltaSeconds) override;

    float value() const {return mValue;}
    float delay() const {return mDelay;}
    float duration() const {return mDuration;}
    float endTime() const {return mDelay + mDuration;}
    bool started() const {return mAnimationTime >= mDelay;}
};
