// SPDX-License-Identifier: MIT
#include "AnimationEasing.hh"

float AnimationEasing::ease(float t) const {
    t = tg::clamp(t, 0.f, 1.f);
    return (powf((1.0f- t), 3.0f) * tg::vec2(0,0)
            + 3 * powf(1- t, 2)*t*mP1
            + 3 * (1-t) * powf(t, 2) * mP2
              + powf(t, 3) * tg::vec2(1, 1)).y;
}

const AnimationEasing AnimationEasing::linear(tg::vec2(1.f / 3, 1.f / 3), tg::vec2(2.f / 3, 2.f / 3));
const AnimationEasing AnimationEasing::easeInOut(tg::vec2(0.3, 0), tg::vec2(0.7, 1));
const AnimationEasing AnimationEasing::easeOut(tg::vec2(0.25, 0.46), tg::vec2(0.45, 0.94));
const AnimationEasing AnimationEasing::backOut(tg::vec2(0.175, 0.885), tg::vec2(0.32, 1.275));
