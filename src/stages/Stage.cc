// SPDX-License-Identifier: MIT
#include "Stage.hh"

#include <algorithm>

#include <glow/common/log.hh>

#include <animation/AnimatorManager.hh>
#include <animation/Tween.hh>
#include <topology/Topology.hh>

namespace Stage {

const char *kindName(Kind kind) {
    switch (kind) {
    case Kind::Vertices: return "vertices";
    case Kind::Edges: return "edges";
    case Kind::Faces: return "faces";
    }
    return "?";
}

size_t primitiveCount(Kind kind, const Topology::Instance &topology) {
    switch (kind) {
    case Kind::Vertices: return topology.vertices.size();
    case Kind::Edges: return topology.edges.size();
    case Kind::Faces: return topology.faces.size();
    }
    return 0;
}

size_t verticesPerPrimitive(Kind kind) {
    switch (kind) {
    case Kind::Vertices: return 1;
    case Kind::Edges: return 2;
    case Kind::Faces: return 3;
    }
    return 1;
}

std::vector<tg::pos3> drawPositions(Kind kind, const Topology::Instance &topology) {
    std::vector<tg::pos3> positions;
    positions.reserve(verticesPerPrimitive(kind) * primitiveCount(kind, topology));
    switch (kind) {
    case Kind::Vertices:
        positions = topology.vertices;
        break;
    case Kind::Edges:
        for (auto &[a, b] : topology.edges) {
            positions.push_back(topology.vertices[a]);
            positions.push_back(topology.vertices[b]);
        }
        break;
    case Kind::Faces:
        for (auto &face : topology.faces)
            for (auto idx : face)
                positions.push_back(topology.vertices[idx]);
        break;
    }
    return positions;
}

void replicate(const std::vector<float> &scalars, size_t times, std::vector<float> &out) {
    out.resize(scalars.size() * times);
    for (size_t i = 0; i < scalars.size(); ++i)
        std::fill_n(out.begin() + i * times, times, scalars[i]);
}

Controller::Controller(Kind kind, AnimatorManager &animators, Reveal::Backend &backend, Timing timing)
  : mKind{kind}, mAnimators{animators}, mBackend{backend}, timing{timing} {}

Controller::~Controller() {
    cancelTweens();
}

void Controller::toggle(const Topology::Instance *topology, float totalBudget) {
    if (!topology)
        return;
    auto count = primitiveCount(mKind, *topology);
    if (count == 0)
        return;

    if (mVisibility != Visibility::Uninitialized && count != mScalars.size())
        reset();
    if (mVisibility == Visibility::Uninitialized) {
        build(*topology);
        if (!mBatch)
            return;
    }

    if (mVisibility == Visibility::Hidden)
        show(totalBudget);
    else
        hide(totalBudget);
}

void Controller::build(const Topology::Instance &topology) {
    mBatch = mBackend.createBatch(mKind, topology);
    if (!mBatch) {
        glow::error() << "could not create the " << kindName(mKind) << " batch";
        return;
    }
    mScalars.assign(primitiveCount(mKind, topology), 0.f);
    mBatch->upload(mScalars);
    mBatch->setVisible(false);
    mDirty = false;
    mVisibility = Visibility::Hidden;
}

void Controller::show(float totalBudget) {
    glow::info() << "Showing " << mScalars.size() << " " << kindName(mKind) << " over " << totalBudget << "s";
    cancelTweens();
    mBatch->setVisible(true);
    mVisibility = Visibility::Shown;
    animateTo(1.f, Stagger::Direction::Forward, totalBudget);
}

void Controller::hide(float totalBudget) {
    glow::info() << "Hiding " << mScalars.size() << " " << kindName(mKind) << " over " << totalBudget << "s";
    cancelTweens();
    mVisibility = Visibility::Hidden;
    animateTo(0.f, Stagger::Direction::Reverse, totalBudget);
    if (Stagger::isInstantaneous(totalBudget))
        mBatch->setVisible(false);
}

void Controller::animateTo(float target, Stagger::Direction direction, float totalBudget) {
    if (Stagger::isInstantaneous(totalBudget)) {
        std::fill(mScalars.begin(), mScalars.end(), target);
        mBatch->upload(mScalars);
        mDirty = false;
        return;
    }

    auto duration = Stagger::itemDurationWithin(timing.itemDuration, totalBudget);
    auto delays = Stagger::delays(mScalars.size(), duration, totalBudget, direction);
    mTweens.reserve(mScalars.size());
    mPending = mScalars.size();
    for (size_t i = 0; i < mScalars.size(); ++i) {
        auto tween = std::make_shared<Tween>(mScalars[i], target, delays[i], duration, timing.easing);
        tween->onUpdate([this, i](float value) {
            mScalars[i] = value;
            mDirty = true;
        });
        // in reverse order index 0 starts last, so it is the last to finish
        bool hidesBatch = direction == Stagger::Direction::Reverse && i == 0;
        tween->onComplete([this, hidesBatch] {
            if (mPending > 0)
                --mPending;
            if (hidesBatch && mBatch)
                mBatch->setVisible(false);
        });
        mAnimators.start(tween);
        mTweens.push_back(std::move(tween));
    }
}

void Controller::cancelTweens() {
    for (auto &tween : mTweens)
        mAnimators.stop(tween);
    mTweens.clear();
    mPending = 0;
}

void Controller::reset() {
    cancelTweens();
    mBatch.reset();
    mScalars.clear();
    mDirty = false;
    mVisibility = Visibility::Uninitialized;
}

void Controller::flush() {
    if (!mDirty || !mBatch)
        return;
    mBatch->upload(mScalars);
    mDirty = false;
}

void Controller::render(MainRenderPass &pass) {
    if (mBatch && mBatch->isVisible())
        mBatch->render(pass);
}

}
