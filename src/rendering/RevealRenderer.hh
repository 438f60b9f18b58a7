// SPDX-License-Identifier: MIT
#pragma once
#include <memory>

#include <fwd.hh>
#include <stages/Backend.hh>
#include "Materials.hh"

/// OpenGL side of the reveal stages, owns the materials every batch draws with
struct RevealRenderer final : public Reveal::Backend {
    VertexMarkerMaterial vertexMaterial;
    EdgeLineMaterial edgeMaterial;
    FaceFillMaterial faceMaterial;
    DissolveMaterial dissolveMaterial;

    void init();
    void applySettings(const Reveal::Settings &settings);

    std::unique_ptr<Stage::Batch> createBatch(Stage::Kind kind, const Topology::Instance &topology) override;
    std::unique_ptr<Dissolve::Surface> createSurface(const Topology::Instance &topology) override;
};
