// SPDX-License-Identifier: MIT
#include "Lighting.hh"
#include <imgui/imgui.h>

using namespace Lighting;

namespace {
tg::vec4 direction(const DirectionalLight &light) {
    return tg::vec4(tg::normalize_safe(light.position), 0);
}

tg::vec4 radiance(const DirectionalLight &light) {
    return tg::vec4(light.color * light.intensity, 0);
}

void lightGui(const char *label, DirectionalLight &light) {
    if (ImGui::TreeNode(label)) {
        ImGui::InputFloat3("Position", &light.position.x);
        ImGui::ColorEdit3("Color", &light.color.x);
        ImGui::SliderFloat("Intensity", &light.intensity, 0, 2);
        ImGui::TreePop();
    }
}
}

Uniforms Settings::getUniforms() const {
    auto uniforms = Lighting::Uniforms();
    uniforms.keyDirection = direction(key);
    uniforms.keyRadiance = radiance(key);
    uniforms.fillDirection = direction(fill);
    uniforms.fillRadiance = radiance(fill);
    uniforms.backDirection = direction(back);
    uniforms.backRadiance = radiance(back);
    uniforms.ambient = tg::vec4(ambientColor * ambientIntensity, 0);

    return uniforms;
}
void Settings::onGui() {
    if (ImGui::TreeNodeEx("Lighting", ImGuiTreeNodeFlags_DefaultOpen)) {
        lightGui("Key light", key);
        lightGui("Fill light", fill);
        lightGui("Back light", back);
        ImGui::ColorEdit3("Ambient Color", &ambientColor.x);
        ImGui::SliderFloat("Ambient Intensity", &ambientIntensity, 0, 1);
        ImGui::TreePop();
    }
}
