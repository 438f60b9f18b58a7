// SPDX-License-Identifier: MIT
#include "Tween.hh"

#include <algorithm>
#include <memory>

Tween::Tween(float from, float to, float delay, float duration, AnimationEasing easing)
  : Animator<FloatKeyFrame>(std::make_shared<Animation<FloatKeyFrame>>()),
    mFrom{from}, mTo{to}, mDelay{std::max(0.f, delay)}, mDuration{std::max(0.f, duration)}, mValue{from}
{
    mAnimation->insertKeyFrames({
        FloatKeyFrame(0.f, mFrom),
        FloatKeyFrame(mDelay, mFrom),
        FloatKeyFrame(mDelay + mDuration, mTo),
    });
    setEasing(easing);
}

void Tween::update(float deltaSeconds) {
    if (finished || cancelled)
        return;

    AbstractAnimator::update(deltaSeconds);
    if (mAnimationTime < mDelay)
        return;

    if (mAnimationTime >= endTime()) {
        mValue = mTo;
        finished = true;
        if (mOnUpdate)
            mOnUpdate(mValue);
        // an update callback may cancel its own tween
        if (mOnComplete && !cancelled)
            mOnComplete();
        return;
    }

    mValue = currentState();
    if (mOnUpdate)
        mOnUpdate(mValue);
}
