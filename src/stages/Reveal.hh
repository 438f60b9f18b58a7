// SPDX-License-Identifier: MIT
#pragma once

#include <optional>
#include <string>

#include <typed-geometry/tg-lean.hh>

#include <MathUtil.hh>
#include <fwd.hh>
#include <topology/Topology.hh>
#include "Dissolve.hh"
#include "Stage.hh"

namespace Reveal {

struct Settings {
    float markerRadius = .05f;
    /// seconds every toggle takes from the first to the last primitive, 0 switches instantly
    float totalBudget = 2.f;

    Stage::Timing vertexTiming {.5f, AnimationEasing::backOut};
    Stage::Timing edgeTiming {.3f, AnimationEasing::easeOut};
    Stage::Timing faceTiming {.4f, AnimationEasing::easeOut};

    tg::color3 vertexColor = Util::unpackSRGB(0xff0000);
    tg::color3 edgeColor = Util::unpackSRGB(0x00ff00);
    tg::color3 faceColor = Util::unpackSRGB(0x0000ff);
    float faceOpacity = .7f;
    float edgeWidth = 3.f;

    tg::color3 meshColor = Util::unpackSRGB(0x808080);
    float metalness = .2f;
    float roughness = .1f;
    /// noise cells per world unit of the dissolve pattern
    float dissolveCellsPerUnit = 40.f;
    float rimWidth = .04f;
    tg::color3 rimColor = tg::color3(1.f, .45f, .1f);

    /// returns true if anything changed
    bool updateUI();
};

/// Holds the current mesh topology and the four toggleable layers built from it.
class System {
    std::optional<Topology::Instance> mTopology;
    std::string mMeshName;

    Stage::Controller mVertices;
    Stage::Controller mEdges;
    Stage::Controller mFaces;
    Dissolve::Assembler mAssembler;

public:
    Settings settings;

    System(AnimatorManager &animators, Backend &backend, Settings settings = {});

    /// Replaces the current mesh. Everything is reset first,
    /// returns false if the mesh was rejected, nothing is loaded then.
    bool loadMesh(const MeshSource::MeshData &mesh);

    void toggleVertices();
    void toggleEdges();
    void toggleFaces();
    void toggleAssembled();
    void reset();

    /// after the animators were updated, once per frame
    void flush();
    void render(MainRenderPass &pass);

    const Topology::Instance *topology() const {return mTopology ? &*mTopology : nullptr;}
    const std::string &meshName() const {return mMeshName;}
    bool isAnimating() const;

    const Stage::Controller &vertices() const {return mVertices;}
    const Stage::Controller &edges() const {return mEdges;}
    const Stage::Controller &faces() const {return mFaces;}
    const Dissolve::Assembler &assembler() const {return mAssembler;}
};

}
