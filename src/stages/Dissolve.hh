// SPDX-License-Identifier: MIT
#pragma once

#include <memory>

#include <typed-geometry/tg-lean.hh>

#include <fwd.hh>
#include "Backend.hh"

namespace Dissolve {

enum class State {
    Absent,
    Dissolving,
    Solid,
    Vanishing,
    Vanished
};

const char *stateName(State state);

/// Hash of the grid cell containing `worldPos`, in [0, 1).
/// Same function as `dissolveHash` in the dissolve shader.
float hash(tg::pos3 worldPos, float cellsPerUnit);

/// a fragment is dropped while its hash is above the dissolve threshold
inline bool discards(float hash, float threshold) {
    return hash > threshold;
}

/// Fades the shaded mesh in and out with a procedural per-fragment dissolve.
class Assembler {
    AnimatorManager &mAnimators;
    Reveal::Backend &mBackend;

    std::unique_ptr<Surface> mSurface;
    std::shared_ptr<Tween> mTween;
    State mState = State::Absent;
    float mDissolve = 0.f;

    void setDissolve(float value);
    void animateTo(float target, float duration);

public:
    Assembler(AnimatorManager &animators, Reveal::Backend &backend);
    ~Assembler();
    Assembler(const Assembler &) = delete;
    Assembler &operator=(const Assembler &) = delete;

    /// assembles on the first call, then alternates between vanishing and reassembling
    void toggle(const Topology::Instance *topology, float duration);
    void reset();
    void flush();
    void render(MainRenderPass &pass);

    State state() const {return mState;}
    float dissolve() const {return mDissolve;}
    bool isAnimating() const {return mState == State::Dissolving || mState == State::Vanishing;}
    const Surface *surface() const {return mSurface.get();}
};

}
