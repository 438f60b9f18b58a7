// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include <typed-geometry/tg-lean.hh>

#include <animation/AnimationEasing.hh>
#include <animation/Stagger.hh>
#include <fwd.hh>
#include "Backend.hh"

namespace Stage {

enum class Visibility {
    Uninitialized,
    Hidden,
    Shown
};

struct Timing {
    /// seconds one primitive takes to appear or disappear
    float itemDuration;
    AnimationEasing easing;
};

const char *kindName(Kind kind);
size_t primitiveCount(Kind kind, const Topology::Instance &topology);

/// draw-vertices per primitive: 1 instance per vertex, 2 line ends per edge, 3 corners per face
size_t verticesPerPrimitive(Kind kind);

/// Draw-vertex positions of a batch, primitive by primitive in topology order.
/// Primitive i owns the run [i * verticesPerPrimitive, (i + 1) * verticesPerPrimitive).
std::vector<tg::pos3> drawPositions(Kind kind, const Topology::Instance &topology);

/// repeats every scalar `times` times, matching the runs of drawPositions()
void replicate(const std::vector<float> &scalars, size_t times, std::vector<float> &out);

/// Owns the batch of one primitive kind and toggles it with a staggered wave.
///
/// The batch is created on the first toggle with every scalar at 0.
/// Showing animates all scalars to 1 in index order, hiding animates them back
/// to 0 in reverse order and hides the batch once index 0 is done.
/// A toggle always cancels the tweens of the previous one first, so toggling
/// mid-flight turns the wave around from the current values.
class Controller {
    Kind mKind;
    AnimatorManager &mAnimators;
    Reveal::Backend &mBackend;

    std::unique_ptr<Batch> mBatch;
    std::vector<float> mScalars;
    std::vector<std::shared_ptr<Tween>> mTweens;
    Visibility mVisibility = Visibility::Uninitialized;
    size_t mPending = 0;
    bool mDirty = false;

    void build(const Topology::Instance &topology);
    void show(float totalBudget);
    void hide(float totalBudget);
    void animateTo(float target, Stagger::Direction direction, float totalBudget);
    void cancelTweens();

public:
    Timing timing;

    Controller(Kind kind, AnimatorManager &animators, Reveal::Backend &backend, Timing timing);
    ~Controller();
    Controller(const Controller &) = delete;
    Controller &operator=(const Controller &) = delete;

    /// shows a hidden stage, hides a shown one. Does nothing without primitives.
    void toggle(const Topology::Instance *topology, float totalBudget);
    /// drops the batch, the next toggle builds a new one
    void reset();
    /// pushes the scalars to the batch if a tween changed them since the last call
    void flush();
    void render(MainRenderPass &pass);

    Kind kind() const {return mKind;}
    Visibility visibility() const {return mVisibility;}
    bool isAnimating() const {return mPending > 0;}
    bool isBuilt() const {return mBatch != nullptr;}
    const std::vector<float> &scalars() const {return mScalars;}
    const Batch *batch() const {return mBatch.get();}
};

}
