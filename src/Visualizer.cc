// SPDX-License-Identifier: MIT
#include "Visualizer.hh"

#include <typed-geometry/tg.hh> // math library

#include <glow/common/log.hh>
#include <glow/common/scoped_gl.hh>
#include <glow/objects/UniformBuffer.hh>

#include <glow-extras/debugging/imgui-util.hh>

#include <GLFW/glfw3.h> // window/input framework

#include <imgui/imgui.h> // UI framework

#include "rendering/MainRenderPass.hh"

Visualizer::Visualizer() : GlfwApp(Gui::ImGui), mReveal(mAnimators, mRenderer) {}
Visualizer::~Visualizer() {}

void Visualizer::init()
{
    setVSync(true);

    // disable built-in camera
    setUseDefaultCamera(false);

    setEnableDebugOverlay(false);

    // set the window resolution
    setWindowWidth(1600);
    setWindowHeight(900);

    // IMPORTANT: call to base class
    GlfwApp::init();

    // set the GUI color theme
    glow::debugging::applyGlowImguiTheme(true);

    setTitle("Mesh Reveal");

    mRenderer.init();
    mRenderer.applySettings(mReveal.settings);
    mHelpers.init();
    mLightingUB = glow::UniformBuffer::create();

    selectShape(mShape);
}

void Visualizer::selectShape(MeshSource::Shape shape) {
    mShape = shape;
    if (mReveal.loadMesh(MeshSource::buildShape(shape))) {
        mStatus = "Click buttons to visualize 3D modeling concepts";
    }
}

void Visualizer::loadObj(const std::string &path) {
    auto mesh = MeshSource::loadObj(path);
    if (!mesh) {
        mStatus = "Could not load " + path;
        return;
    }
    if (mReveal.loadMesh(*mesh)) {
        mStatus = "Loaded " + path;
    } else {
        mStatus = path + " is not a valid triangle mesh";
    }
}

void Visualizer::processKeys() {
    if (ImGui::GetIO().WantCaptureKeyboard) {return;}
    auto &in = input();
    if (in.isKeyPressed(GLFW_KEY_1)) {mReveal.toggleVertices();}
    if (in.isKeyPressed(GLFW_KEY_2)) {mReveal.toggleEdges();}
    if (in.isKeyPressed(GLFW_KEY_3)) {mReveal.toggleFaces();}
    if (in.isKeyPressed(GLFW_KEY_4)) {mReveal.toggleAssembled();}
    if (in.isKeyPressed(GLFW_KEY_R)) {mReveal.reset();}
    if (in.isKeyPressed(GLFW_KEY_SPACE)) {mAnimators.setPaused(!mAnimators.isPaused());}
}

// render variable timestep
void Visualizer::render(float elapsedSeconds)
{
    processKeys();
    updateCamera(elapsedSeconds);

    // tweens write the stage scalars, flush uploads them once per frame
    mAnimators.updateAllAnimators(elapsedSeconds);
    mReveal.flush();

    MainRenderPass pass;
    pass.wallTime = getRenderTimeD();
    pass.cameraPosition = mCamera.position();
    pass.projMatrix = mCamera.projectionMatrix();
    pass.viewMatrix = mCamera.viewMatrix();
    pass.viewProjMatrix = pass.projMatrix * pass.viewMatrix;
    pass.viewPortSize = getWindowSize();

    mLightingUB->bind().setData(mLightingSettings.getUniforms(), GL_DYNAMIC_DRAW);
    pass.lightingUniforms = mLightingUB;

    glClearColor(mBackground.r, mBackground.g, mBackground.b, 1.f);
    glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

    mHelpers.render(pass);
    mReveal.render(pass);
}

void Visualizer::onGui() {
    if (ImGui::Begin("Mesh Reveal"))
    {
        auto current = int(mShape);
        if (ImGui::BeginCombo("Shape", MeshSource::shapeName(mShape))) {
            for (auto shape : MeshSource::allShapes) {
                if (ImGui::Selectable(MeshSource::shapeName(shape), int(shape) == current)) {
                    selectShape(shape);
                }
            }
            ImGui::EndCombo();
        }
        ImGui::InputText("OBJ file", mObjPath, sizeof(mObjPath));
        ImGui::SameLine();
        if (ImGui::Button("Load")) {loadObj(mObjPath);}

        ImGui::Separator();
        if (ImGui::Button("Show Vertices")) {mReveal.toggleVertices();}
        ImGui::SameLine();
        if (ImGui::Button("Connect Edges")) {mReveal.toggleEdges();}
        ImGui::SameLine();
        if (ImGui::Button("Form Faces")) {mReveal.toggleFaces();}
        ImGui::SameLine();
        if (ImGui::Button("Assemble Mesh")) {mReveal.toggleAssembled();}
        ImGui::SameLine();
        if (ImGui::Button("Reset")) {mReveal.reset();}

        if (mReveal.settings.updateUI()) {
            mRenderer.applySettings(mReveal.settings);
        }

        ImGui::Separator();
        if (auto topology = mReveal.topology()) {
            ImGui::Text("Mesh: %s", mReveal.meshName().c_str());
            ImGui::Text("Vertices: %zu", topology->vertices.size());
            ImGui::Text("Edges: %zu", topology->edges.size());
            ImGui::Text("Faces: %zu", topology->faces.size());
        } else {
            ImGui::TextUnformatted("No mesh loaded");
        }
        ImGui::TextWrapped("%s", mStatus.c_str());

        if (ImGui::TreeNode("Controls"))
        {
            ImGui::TextUnformatted("1-4   - Vertices / Edges / Faces / Assemble");
            ImGui::TextUnformatted("R     - Reset");
            ImGui::TextUnformatted("Space - Pause animations");
            ImGui::TextUnformatted("RMB   - Orbit");
            ImGui::TextUnformatted("Wheel - Zoom");
            ImGui::TreePop();
        }
    }
    ImGui::End();

    if (ImGui::Begin("View")) {
        mCamera.updateUI();
        mHelpers.updateUI();
        ImGui::ColorEdit3("Background", &mBackground.r);
        mLightingSettings.onGui();
    }
    ImGui::End();
}

// Called when window is resized
void Visualizer::onResize(int w, int h)
{
    mCamera.mAspect = (float)w / h;
    glViewport(0, 0, w, h);
}

// called once per frame
void Visualizer::updateCamera(float elapsedSeconds)
{
    auto &io = ImGui::GetIO();
    auto drag = tg::vec2(0, 0);
    if (isMouseButtonDown(GLFW_MOUSE_BUTTON_RIGHT) && !io.WantCaptureMouse) {
        auto mouse_delta = input().getMouseDelta();
        drag = tg::vec2(float(mouse_delta.x), float(-mouse_delta.y));
    }
    float scroll = io.WantCaptureMouse ? 0.f : io.MouseWheel;
    mCamera.update(elapsedSeconds, drag, scroll);
}
