// SPDX-License-Identifier: MIT
#pragma once
#include <typed-geometry/tg.hh>
#include <glow/std140.hh>

namespace Lighting
{
struct Uniforms {
    // xyz: direction from the surface towards the light, w unused
    glow::std140vec4 keyDirection;
    glow::std140vec4 keyRadiance;
    glow::std140vec4 fillDirection;
    glow::std140vec4 fillRadiance;
    glow::std140vec4 backDirection;
    glow::std140vec4 backRadiance;
    glow::std140vec4 ambient;
};

struct DirectionalLight {
    tg::vec3 position;
    tg::vec3 color = tg::vec3(1, 1, 1);
    float intensity = 1;
};

/// three-point rig, every light shines towards the origin
struct Settings
{
    DirectionalLight key {tg::vec3(2, 2, 1), tg::vec3(1, 1, 1), 1.f};
    DirectionalLight fill {tg::vec3(-2, 1, 1), tg::vec3(1, 1, 1), .1f};
    DirectionalLight back {tg::vec3(0, -1, -2), tg::vec3(1, 1, 1), .6f};

    tg::vec3 ambientColor = tg::vec3(1, 1, 1);
    float ambientIntensity = .15f;

    [[nodiscard]] Uniforms getUniforms() const;
    void onGui();
};
}
