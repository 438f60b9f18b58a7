// SPDX-License-Identifier: MIT
#include "SceneHelpers.hh"

#include <vector>

#include <glow/common/scoped_gl.hh>
#include <glow/objects/ArrayBuffer.hh>
#include <glow/objects/Program.hh>
#include <glow/objects/VertexArray.hh>
#include <imgui/imgui.h>
#include <typed-geometry/tg.hh>

#include <MathUtil.hh>
#include <Util.hh>
#include <rendering/MainRenderPass.hh>

namespace {

struct LineVertex {
    tg::pos3 position;
    tg::color3 color;
};

glow::SharedVertexArray createLines(const std::vector<LineVertex> &verts) {
    return glow::VertexArray::create(glow::ArrayBuffer::create({
        {&LineVertex::position, "aPosition"},
        {&LineVertex::color, "aColor"},
    }, verts), nullptr, GL_LINES);
}

}

void SceneHelpers::init() {
    lineShader = glow::Program::createFromFile("../data/shaders/helpers/lines");

    auto centerColor = Util::unpackSRGB(0x444444), gridColor = Util::unpackSRGB(0x888888);
    std::vector<LineVertex> grid;
    auto half = gridSize / 2;
    auto step = gridSize / gridDivisions;
    for (auto i : Util::IntRange(gridDivisions + 1)) {
        auto k = -half + i * step;
        auto color = 2 * i == gridDivisions ? centerColor : gridColor;
        grid.push_back({{-half, gridHeight, k}, color});
        grid.push_back({{half, gridHeight, k}, color});
        grid.push_back({{k, gridHeight, -half}, color});
        grid.push_back({{k, gridHeight, half}, color});
    }
    gridVao = createLines(grid);

    // slightly above the grid so the axes win the depth test
    auto y = gridHeight + .001f;
    auto red = Util::unpackSRGB(0xff0000), blue = Util::unpackSRGB(0x0000ff);
    axesVao = createLines(std::vector<LineVertex> {
        {{0, y, 0}, red}, {{axisLength, y, 0}, red},
        {{0, y, 0}, blue}, {{0, y, axisLength}, blue},
    });

    auto green = Util::unpackSRGB(0x00ff00);
    navigationVao = createLines(std::vector<LineVertex> {
        {{0, 0, 0}, red}, {{navigationSize, 0, 0}, red},
        {{0, 0, 0}, green}, {{0, navigationSize, 0}, green},
        {{0, 0, 0}, blue}, {{0, 0, navigationSize}, blue},
    });
}

void SceneHelpers::render(MainRenderPass &pass) {
    auto shader = lineShader->use();
    if (showGrid) {
        GLOW_SCOPED(enable, GL_DEPTH_TEST);
        pass.applyCommons(shader);
        gridVao->bind().draw();
        axesVao->bind().draw();
    }
    if (showNavigation) {
        // drawn over the scene
        GLOW_SCOPED(disable, GL_DEPTH_TEST);
        shader["uViewProj"] = pass.projMatrix * Util::cameraAnchored(pass.viewMatrix, navigationOffset);
        navigationVao->bind().draw();
    }
}

void SceneHelpers::updateUI() {
    ImGui::Checkbox("Show grid", &showGrid);
    ImGui::Checkbox("Show navigation axes", &showNavigation);
}
