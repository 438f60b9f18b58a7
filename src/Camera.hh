// SPDX-License-Identifier: MIT
#pragma once
#include <typed-geometry/tg-lean.hh>

/// Orbits around mTarget. Mouse input adds angular velocity which decays with mDamping per frame.
class Camera {
public:
    tg::pos3 mTarget = tg::pos3(0, 0, 0);
    float mYaw = 0.f, mPitch = 0.f;  // radians
    float mDistance = 3.f;
    float mAspect = 1.0;
    float mFovDegrees = 75.f;
    float mNear = .1f, mFar = 1000.f;
    float mDamping = .05f;
    float mRotateSpeed = .005f;
    tg::vec2 mAngularVelocity = tg::vec2(0, 0);

    void update(float dt, tg::vec2 mouseDrag, float scroll);
    void updateUI();
    tg::pos3 position() const;
    tg::mat4 viewMatrix() const;
    tg::mat4 projectionMatrix() const;
};
