// SPDX-License-Identifier: MIT
#include "Reveal.hh"

#include <imgui/imgui.h>

namespace Reveal {

namespace {
bool timingGui(const char *label, Stage::Timing &timing) {
    return ImGui::SliderFloat(label, &timing.itemDuration, 0.f, 2.f, "%.2f s");
}
}

bool Settings::updateUI() {
    bool changed = false;
    if (ImGui::TreeNodeEx("Animation", ImGuiTreeNodeFlags_DefaultOpen)) {
        ImGui::SliderFloat("Total time", &totalBudget, 0.f, 10.f, "%.2f s");
        changed |= ImGui::SliderFloat("Vertex size", &markerRadius, .01f, .2f);
        timingGui("Vertex pop-in", vertexTiming);
        timingGui("Edge fade", edgeTiming);
        timingGui("Face fade", faceTiming);
        ImGui::TreePop();
    }
    if (ImGui::TreeNode("Appearance")) {
        changed |= ImGui::ColorEdit3("Vertices", &vertexColor.r);
        changed |= ImGui::ColorEdit3("Edges", &edgeColor.r);
        changed |= ImGui::SliderFloat("Edge width", &edgeWidth, 1.f, 8.f);
        changed |= ImGui::ColorEdit3("Faces", &faceColor.r);
        changed |= ImGui::SliderFloat("Face opacity", &faceOpacity, 0.f, 1.f);
        changed |= ImGui::ColorEdit3("Mesh", &meshColor.r);
        changed |= ImGui::SliderFloat("Metalness", &metalness, 0.f, 1.f);
        changed |= ImGui::SliderFloat("Roughness", &roughness, .02f, 1.f);
        changed |= ImGui::SliderFloat("Dissolve cells", &dissolveCellsPerUnit, 1.f, 200.f);
        changed |= ImGui::SliderFloat("Rim width", &rimWidth, 0.f, .2f);
        changed |= ImGui::ColorEdit3("Rim", &rimColor.r);
        ImGui::TreePop();
    }
    return changed;
}

}
