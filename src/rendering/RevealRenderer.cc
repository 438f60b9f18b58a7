// SPDX-License-Identifier: MIT
#include "RevealRenderer.hh"

#include <stages/Reveal.hh>
#include "StageBatches.hh"

void RevealRenderer::init() {
    vertexMaterial.init();
    edgeMaterial.init();
    faceMaterial.init();
    dissolveMaterial.init();
}

void RevealRenderer::applySettings(const Reveal::Settings &settings) {
    vertexMaterial.color = settings.vertexColor;
    vertexMaterial.radius = settings.markerRadius;
    edgeMaterial.color = settings.edgeColor;
    edgeMaterial.lineWidth = settings.edgeWidth;
    faceMaterial.color = settings.faceColor;
    faceMaterial.opacity = settings.faceOpacity;
    dissolveMaterial.albedo = settings.meshColor;
    dissolveMaterial.metalness = settings.metalness;
    dissolveMaterial.roughness = settings.roughness;
    dissolveMaterial.cellsPerUnit = settings.dissolveCellsPerUnit;
    dissolveMaterial.rimWidth = settings.rimWidth;
    dissolveMaterial.rimColor = settings.rimColor;
}

std::unique_ptr<Stage::Batch> RevealRenderer::createBatch(Stage::Kind kind, const Topology::Instance &topology) {
    switch (kind) {
    case Stage::Kind::Vertices: return std::make_unique<VertexMarkerBatch>(vertexMaterial, topology);
    case Stage::Kind::Edges: return std::make_unique<EdgeLineBatch>(edgeMaterial, topology);
    case Stage::Kind::Faces: return std::make_unique<FaceFillBatch>(faceMaterial, topology);
    }
    return nullptr;
}

std::unique_ptr<Dissolve::Surface> RevealRenderer::createSurface(const Topology::Instance &topology) {
    return std::make_unique<AssembledSurface>(dissolveMaterial, topology);
}
