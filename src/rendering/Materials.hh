// SPDX-License-Identifier: MIT
#pragma once
#include <glow/fwd.hh>
#include <typed-geometry/tg-lean.hh>

#include <fwd.hh>

/// One struct per shading stage. Each owns its program and the parameters
/// the stage settings feed into it, `apply` binds lighting and camera as well.

struct VertexMarkerMaterial {
    glow::SharedProgram program;
    tg::color3 color;
    float radius = .05f;

    void init();
    void apply(glow::UsedProgram &shader, MainRenderPass &pass) const;
};

struct EdgeLineMaterial {
    glow::SharedProgram program;
    tg::color3 color;
    float lineWidth = 3.f;

    void init();
    void apply(glow::UsedProgram &shader, MainRenderPass &pass) const;
};

struct FaceFillMaterial {
    glow::SharedProgram program;
    tg::color3 color;
    float opacity = .7f;

    void init();
    void apply(glow::UsedProgram &shader, MainRenderPass &pass) const;
};

struct DissolveMaterial {
    glow::SharedProgram program;
    tg::color3 albedo;
    float metalness = .2f;
    float roughness = .1f;
    float cellsPerUnit = 40.f;
    float rimWidth = .04f;
    tg::color3 rimColor;

    void init();
    void apply(glow::UsedProgram &shader, MainRenderPass &pass) const;
};
