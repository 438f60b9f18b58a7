// SPDX-License-Identifier: MIT
#include "Animator.hh"
#include <algorithm>
#include <utility>

float AbstractAnimator::interpolationValueBetween(float frame1Time, float frame2Time, float time) const
{
    if (frame1Time == frame2Time)
    {
        return 1;
    }

    float interpolationVal = tg::clamp((time - frame1Time) / (frame2Time - frame1Time), 0.f, 1.f);

    if (!isLinear)
    {
        interpolationVal = easing.ease(interpolationVal);
    }
    return interpolationVal;
}

void AbstractAnimator::update(float deltaSeconds) {
    mAnimationTime += deltaSeconds;
    updateCurrentKeyFrame();
}

void AbstractAnimator::reset() {
    currentKeyFrameIdx = 0;
    finished = false;
    cancelled = false;
    mAnimationTime = 0.0f;
}

void AbstractAnimator::setEasing(AnimationEasing animEasing) {
    this->isLinear = false;
    this->easing = animEasing;
}

template<typename Frame_T>
void Animator<Frame_T>::updateCurrentKeyFrame()
{
    if (currentKeyFrameIdx == mAnimation->lastKeyFrameIdx)
    {
        if (loop)
        {
            reset();
        }
        else
        {
            finished = true;
        }
        // Stay at last frame
        return;
    }
    while (mAnimationTime > getNextKeyFrame().mTime && currentKeyFrameIdx != mAnimation->lastKeyFrameIdx)
    {
        currentKeyFrameIdx++;
    }
}

template<typename Frame_T>
Animator<Frame_T>::Animator(std::shared_ptr<Animation<Frame_T>> animation) {
    this->mAnimation = std::move(animation);
}

template<typename Frame_T>
Frame_T& Animator<Frame_T>::getNextKeyFrame() {
    return mAnimation->keyFrames[std::min(currentKeyFrameIdx + 1, mAnimation->lastKeyFrameIdx)];
}

template<typename Frame_T>
float Animator<Frame_T>::currentState() {
    auto& currentKeyFrame = mAnimation->keyFrames[currentKeyFrameIdx];
    auto& nextKeyFrame = getNextKeyFrame();
    return interpolateBetween(currentKeyFrame, nextKeyFrame, mAnimationTime);
}

template<typename Frame_T>
float Animator<Frame_T>::interpolateBetween(Frame_T& frame1, Frame_T& frame2, float time) {
    float t = interpolationValueBetween(frame1.mTime, frame2.mTime, time);
    return frame1.interpolateTo(frame2, t);
}

template class Animator<FloatKeyFrame>;
