// SPDX-License-Identifier: MIT
#pragma once
#include <vector>

#include <glow/fwd.hh>
#include <typed-geometry/tg-lean.hh>

#include <fwd.hh>
#include <stages/Backend.hh>
#include "Materials.hh"

/// low-poly sphere instanced at every vertex, the scalar scales the instance
class VertexMarkerBatch final : public Stage::Batch {
    const VertexMarkerMaterial &mMaterial;
    glow::SharedVertexArray mVao;
    glow::SharedArrayBuffer mScaleBuffer;
    int mCount;
    bool mVisible = false;

public:
    VertexMarkerBatch(const VertexMarkerMaterial &material, const Topology::Instance &topology);
    void setVisible(bool visible) override {mVisible = visible;}
    bool isVisible() const override {return mVisible;}
    void upload(const std::vector<float> &scalars) override;
    void render(MainRenderPass &pass) override;
};

/// GL_LINES, the scalar of an edge fades both of its line vertices
class EdgeLineBatch final : public Stage::Batch {
    const EdgeLineMaterial &mMaterial;
    glow::SharedVertexArray mVao;
    glow::SharedArrayBuffer mVisibilityBuffer;
    std::vector<float> mExpanded;
    bool mVisible = false;

public:
    EdgeLineBatch(const EdgeLineMaterial &material, const Topology::Instance &topology);
    void setVisible(bool visible) override {mVisible = visible;}
    bool isVisible() const override {return mVisible;}
    void upload(const std::vector<float> &scalars) override;
    void render(MainRenderPass &pass) override;
};

/// unindexed triangles, the scalar of a face fades its three corners
class FaceFillBatch final : public Stage::Batch {
    const FaceFillMaterial &mMaterial;
    glow::SharedVertexArray mVao;
    glow::SharedArrayBuffer mVisibilityBuffer;
    std::vector<float> mExpanded;
    bool mVisible = false;

public:
    FaceFillBatch(const FaceFillMaterial &material, const Topology::Instance &topology);
    void setVisible(bool visible) override {mVisible = visible;}
    bool isVisible() const override {return mVisible;}
    void upload(const std::vector<float> &scalars) override;
    void render(MainRenderPass &pass) override;
};

/// the lit solid, flat shaded, dissolved per fragment in the shader
class AssembledSurface final : public Dissolve::Surface {
    const DissolveMaterial &mMaterial;
    glow::SharedVertexArray mVao;
    float mThreshold = 0.f;
    bool mVisible = false;

public:
    AssembledSurface(const DissolveMaterial &material, const Topology::Instance &topology);
    void setVisible(bool visible) override {mVisible = visible;}
    bool isVisible() const override {return mVisible;}
    void setThreshold(float threshold) override {mThreshold = threshold;}
    void render(MainRenderPass &pass) override;
};
