// SPDX-License-Identifier: MIT
#include "Dissolve.hh"

#include <cmath>
#include <cstdint>

#include <glow/common/log.hh>

#include <animation/AnimatorManager.hh>
#include <animation/Stagger.hh>
#include <animation/Tween.hh>
#include <topology/Topology.hh>

namespace Dissolve {

const char *stateName(State state) {
    switch (state) {
    case State::Absent: return "absent";
    case State::Dissolving: return "dissolving";
    case State::Solid: return "solid";
    case State::Vanishing: return "vanishing";
    case State::Vanished: return "vanished";
    }
    return "?";
}

float hash(tg::pos3 worldPos, float cellsPerUnit) {
    // pcg3d, Jarzynski and Olano 2020
    auto cell = [cellsPerUnit](float v) {
        return uint32_t(int32_t(std::floor(v * cellsPerUnit)));
    };
    uint32_t x = cell(worldPos.x);
    uint32_t y = cell(worldPos.y);
    uint32_t z = cell(worldPos.z);

    x = x * 1664525u + 1013904223u;
    y = y * 1664525u + 1013904223u;
    z = z * 1664525u + 1013904223u;
    x += y * z; y += z * x; z += x * y;
    x ^= x >> 16u; y ^= y >> 16u; z ^= z >> 16u;
    x += y * z; y += z * x; z += x * y;

    return float(x >> 8) / 16777216.f;
}

Assembler::Assembler(AnimatorManager &animators, Reveal::Backend &backend)
  : mAnimators{animators}, mBackend{backend} {}

Assembler::~Assembler() {
    if (mTween)
        mAnimators.stop(mTween);
}

void Assembler::setDissolve(float value) {
    mDissolve = value;
    if (mSurface)
        mSurface->setThreshold(value);
}

void Assembler::toggle(const Topology::Instance *topology, float duration) {
    if (!topology || topology->faces.empty())
        return;

    if (mTween) {
        mAnimators.stop(mTween);
        mTween.reset();
    }

    switch (mState) {
    case State::Absent:
        mSurface = mBackend.createSurface(*topology);
        if (!mSurface) {
            glow::error() << "could not create the assembled mesh";
            return;
        }
        setDissolve(0.f);
        mSurface->setVisible(true);
        glow::info() << "Assembling " << topology->faces.size() << " faces over " << duration << "s";
        animateTo(1.f, duration);
        break;
    case State::Dissolving:
    case State::Solid:
        glow::info() << "Vanishing assembled mesh over " << duration << "s";
        animateTo(0.f, duration);
        break;
    case State::Vanishing:
    case State::Vanished:
        mSurface->setVisible(true);
        glow::info() << "Reassembling mesh over " << duration << "s";
        animateTo(1.f, duration);
        break;
    }
}

void Assembler::animateTo(float target, float duration) {
    bool vanish = target == 0.f;
    if (Stagger::isInstantaneous(duration)) {
        setDissolve(target);
        if (vanish)
            mSurface->setVisible(false);
        mState = vanish ? State::Vanished : State::Solid;
        return;
    }

    mState = vanish ? State::Vanishing : State::Dissolving;
    mTween = std::make_shared<Tween>(mDissolve, target, 0.f, duration, AnimationEasing::easeInOut);
    mTween->onUpdate([this](float value) {
        mDissolve = value;
    });
    mTween->onComplete([this, vanish] {
        if (vanish && mSurface)
            mSurface->setVisible(false);
        mState = vanish ? State::Vanished : State::Solid;
    });
    mAnimators.start(mTween);
}

void Assembler::reset() {
    if (mTween) {
        mAnimators.stop(mTween);
        mTween.reset();
    }
    mSurface.reset();
    mDissolve = 0.f;
    mState = State::Absent;
}

void Assembler::flush() {
    if (mSurface)
        mSurface->setThreshold(mDissolve);
}

void Assembler::render(MainRenderPass &pass) {
    if (mSurface && mSurface->isVisible())
        mSurface->render(pass);
}

}
