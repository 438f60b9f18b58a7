// SPDX-License-Identifier: MIT
#include "MainRenderPass.hh"
#include <glow/objects.hh>
#include <typed-geometry/tg.hh>

void MainRenderPass::applyCommons(glow::UsedProgram& shader) {
    shader["uViewProj"] = viewProjMatrix;
    shader["uCamPos"] = cameraPosition;
}
