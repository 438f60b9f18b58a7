// SPDX-License-Identifier: MIT
#pragma once

#include <typed-geometry/tg-lean.hh>

struct AbstractKeyFrame
{
    float mTime;
    inline explicit AbstractKeyFrame(float time) : mTime(time) {}
    AbstractKeyFrame() = default;
};

struct FloatKeyFrame final : public AbstractKeyFrame {
    float mValue = 0.f;
    FloatKeyFrame() = default;
    inline FloatKeyFrame(float time, float value) : AbstractKeyFrame(time), mValue(value) {}

    float interpolateTo(const FloatKeyFrame &next, float t) const {
        return tg::lerp(mValue, next.mValue, t);
    }
};
