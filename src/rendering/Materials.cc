// SPDX-License-Identifier: MIT
#include "Materials.hh"

#include <glow/objects/Program.hh>
#include <typed-geometry/tg.hh>

#include <rendering/MainRenderPass.hh>

void VertexMarkerMaterial::init() {
    program = glow::Program::createFromFile("../data/shaders/reveal/vertex_marker");
}

void VertexMarkerMaterial::apply(glow::UsedProgram &shader, MainRenderPass &pass) const {
    pass.applyCommons(shader);
    shader["uColor"] = color;
    shader["uRadius"] = radius;
}

void EdgeLineMaterial::init() {
    program = glow::Program::createFromFile("../data/shaders/reveal/edge_line");
}

void EdgeLineMaterial::apply(glow::UsedProgram &shader, MainRenderPass &pass) const {
    pass.applyCommons(shader);
    shader["uColor"] = color;
}

void FaceFillMaterial::init() {
    program = glow::Program::createFromFile("../data/shaders/reveal/face_fill");
}

void FaceFillMaterial::apply(glow::UsedProgram &shader, MainRenderPass &pass) const {
    pass.applyCommons(shader);
    shader["uColor"] = color;
    shader["uOpacity"] = opacity;
}

void DissolveMaterial::init() {
    program = glow::Program::createFromFile("../data/shaders/reveal/dissolve");
}

void DissolveMaterial::apply(glow::UsedProgram &shader, MainRenderPass &pass) const {
    pass.applyCommons(shader);
    shader["uAlbedo"] = albedo;
    shader["uMetalness"] = metalness;
    shader["uRoughness"] = roughness;
    shader["uCellsPerUnit"] = cellsPerUnit;
    shader["uRimWidth"] = rimWidth;
    shader["uRimColor"] = rimColor;
}
