// SPDX-License-Identifier: MIT
#pragma once

#include <memory>
#include <vector>
#include "Animation.hh"
#include "AnimationEasing.hh"
#include "KeyFrame.hh"

class AbstractAnimator {
protected:
    int currentKeyFrameIdx = 0;
    virtual void updateCurrentKeyFrame() = 0;
    bool isLinear = true;
    AnimationEasing easing = AnimationEasing::easeInOut;
    float interpolationValueBetween(float frame1Time, float frame2Time, float time) const;
public:
    virtual ~AbstractAnimator() {}
    float mAnimationTime = 0.f;
    bool loop = false;
    bool finished = false;
    /// set by cancel(), a cancelled animator never fires its callbacks again
    bool cancelled = false;
    virtual void update(float deltaSeconds);
    void reset();
    void cancel() {cancelled = true;}
    void setEasing(AnimationEasing animEasing);
};

template<typename Frame_T>
class Animator : public AbstractAnimator
{
public:
    explicit Animator(std::shared_ptr<Animation<Frame_T>> animation);

    std::shared_ptr<Animation<Frame_T>> mAnimation;
    virtual float interpolateBetween(Frame_T& frame1, Frame_T& frame2, float time);
    virtual float currentState();
    virtual Frame_T& getNextKeyFrame();
    void updateCurrentKeyFrame() override;
};
