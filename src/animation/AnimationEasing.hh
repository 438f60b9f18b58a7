// SPDX-License-Identifier: MIT
#pragma once

#include <typed-geometry/tg.hh>

/// cubic bezier from (0,0) to (1,1), evaluated on its y component
struct AnimationEasing
{
private:
    tg::vec2 mP1;
    tg::vec2 mP2;

public:
    static const AnimationEasing linear;
    static const AnimationEasing easeInOut;
    static const AnimationEasing easeOut;
    /// overshoots past 1 before settling, used for the vertex pop-in
    static const AnimationEasing backOut;

    AnimationEasing(tg::vec2 p1, tg::vec2 p2) : mP1{p1}, mP2{p2} {};
    float ease(float t) const;
};
