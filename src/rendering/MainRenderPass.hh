// SPDX-License-Identifier: MIT
#pragma once
#include <glow/fwd.hh>
#include <typed-geometry/tg-lean.hh>

#include <fwd.hh>

struct MainRenderPass {
    double wallTime;

    tg::mat4 viewMatrix;
    tg::mat4 projMatrix;
    tg::mat4 viewProjMatrix;
    tg::pos3 cameraPosition;
    tg::isize2 viewPortSize;

    glow::SharedUniformBuffer lightingUniforms;

    void applyCommons(glow::UsedProgram& shader);
};
