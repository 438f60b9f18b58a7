// SPDX-License-Identifier: MIT
#include "Camera.hh"

#include <typed-geometry/tg.hh>
#include <imgui/imgui.h>

void Camera::updateUI() {
    auto pos = position();
    ImGui::Text("Cam pos: %.2f %.2f %.2f", pos.x, pos.y, pos.z);
    ImGui::SliderFloat("Distance", &mDistance, .5f, 50.f);
    ImGui::SliderFloat("Field of view", &mFovDegrees, 20.f, 120.f);
    ImGui::SliderFloat("Damping", &mDamping, .01f, 1.f);
    if (ImGui::Button("Reset view")) {
        mYaw = mPitch = 0.f;
        mDistance = 3.f;
        mAngularVelocity = tg::vec2(0, 0);
    }
}

tg::pos3 Camera::position() const {
    auto [sinYaw, cosYaw] = tg::sin_cos(tg::angle32::from_radians(mYaw));
    auto [sinPitch, cosPitch] = tg::sin_cos(tg::angle32::from_radians(mPitch));
    return mTarget + mDistance * tg::vec3(cosPitch * sinYaw, sinPitch, cosPitch * cosYaw);
}

tg::mat4 Camera::viewMatrix() const {
    return tg::look_at_opengl(position(), mTarget, tg::vec3::unit_y);
}

tg::mat4 Camera::projectionMatrix() const {
    return tg::perspective_opengl(tg::angle32::from_degree(mFovDegrees), mAspect, mNear, mFar);
}

void Camera::update(float dt, tg::vec2 mouseDrag, float scroll) {
    mAngularVelocity -= mouseDrag * mRotateSpeed;

    mYaw += mAngularVelocity.x;
    mPitch = tg::clamp(mPitch + mAngularVelocity.y, -1.55f, 1.55f);
    // damping factor is per 60 Hz frame
    mAngularVelocity *= tg::pow(1.f - mDamping, dt * 60.f);

    if (scroll != 0.f) {
        mDistance = tg::clamp(mDistance * tg::pow(.95f, scroll), .5f, 50.f);
    }
}
