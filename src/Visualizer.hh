// SPDX-License-Identifier: MIT
#pragma once
#include <string>

#include <glow-extras/glfw/GlfwApp.hh>
#include <glow/fwd.hh>

#include "Camera.hh"
#include "animation/AnimatorManager.hh"
#include "environment/Lighting.hh"
#include "fwd.hh"
#include "rendering/RevealRenderer.hh"
#include "rendering/SceneHelpers.hh"
#include "stages/Reveal.hh"
#include "topology/MeshSource.hh"

class Visualizer : public glow::glfw::GlfwApp
{
    // declared before mReveal, the stages cancel their tweens on destruction
    AnimatorManager mAnimators;
    RevealRenderer mRenderer;
    Reveal::System mReveal;

    Camera mCamera;
    Lighting::Settings mLightingSettings;
    glow::SharedUniformBuffer mLightingUB;
    SceneHelpers mHelpers;

    MeshSource::Shape mShape = MeshSource::Shape::Box;
    char mObjPath[512] = "../data/meshes/octahedron.obj";
    std::string mStatus;
    tg::color3 mBackground = tg::color3(0x11 / 255.f, 0x11 / 255.f, 0x11 / 255.f);

public:
    Visualizer();
    ~Visualizer();

    // === events
    void init() override;                       // called once after OpenGL is set up
    void render(float elapsedSeconds) override; // called once per frame (variable timestep)
    void onGui() override;                      // called once per frame to set up UI
    void onResize(int w, int h) override;       // called when window is resized

    void selectShape(MeshSource::Shape shape);
    void loadObj(const std::string &path);
    void processKeys();
    void updateCamera(float elapsedSeconds);
};
