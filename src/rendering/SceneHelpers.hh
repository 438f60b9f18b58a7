// SPDX-License-Identifier: MIT
#pragma once
#include <glow/fwd.hh>
#include <typed-geometry/tg-lean.hh>

#include <fwd.hh>

/// ground grid, the colored floor axes and a small axes marker in the upper right
struct SceneHelpers {
    glow::SharedProgram lineShader;
    glow::SharedVertexArray gridVao, axesVao, navigationVao;

    float gridSize = 10.f;
    int gridDivisions = 10;
    float gridHeight = -1.f;
    float axisLength = 6.f;
    bool showGrid = true;

    /// camera space position of the navigation axes
    tg::vec3 navigationOffset = tg::vec3(1.f, .5f, -1.f);
    float navigationSize = .1f;
    bool showNavigation = true;

    void init();
    void render(MainRenderPass &pass);
    void updateUI();
};
