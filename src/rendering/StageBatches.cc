// SPDX-License-Identifier: MIT
#include "StageBatches.hh"

#include <glow/common/scoped_gl.hh>
#include <glow/objects/ArrayBuffer.hh>
#include <glow/objects/ElementArrayBuffer.hh>
#include <glow/objects/Program.hh>
#include <glow/objects/UniformBuffer.hh>
#include <glow/objects/VertexArray.hh>
#include <typed-geometry/tg.hh>

#include <MathUtil.hh>
#include <rendering/MainRenderPass.hh>
#include <stages/Stage.hh>
#include <topology/MeshSource.hh>
#include <topology/Topology.hh>

VertexMarkerBatch::VertexMarkerBatch(const VertexMarkerMaterial &material, const Topology::Instance &topology)
  : mMaterial{material}, mCount{int(topology.vertices.size())}
{
    auto marker = MeshSource::sphere(1.f, 8, 6, "marker");
    std::vector<tg::vec3> normals;
    normals.reserve(marker.positions.size());
    for (auto &p : marker.positions)
        normals.push_back(tg::normalize_safe(tg::vec3(p)));

    auto centers = glow::ArrayBuffer::create("aCenter", topology.vertices);
    centers->setDivisor(1);
    mScaleBuffer = glow::ArrayBuffer::create("aScale", std::vector<float>(topology.vertices.size(), 0.f));
    mScaleBuffer->setDivisor(1);
    mVao = glow::VertexArray::create({
        glow::ArrayBuffer::create("aPosition", marker.positions),
        glow::ArrayBuffer::create("aNormal", normals),
        centers, mScaleBuffer
    }, glow::ElementArrayBuffer::create(*marker.indices), GL_TRIANGLES);
}

void VertexMarkerBatch::upload(const std::vector<float> &scalars) {
    mScaleBuffer->bind().setData(scalars);
}

void VertexMarkerBatch::render(MainRenderPass &pass) {
    GLOW_SCOPED(enable, GL_DEPTH_TEST);
    GLOW_SCOPED(enable, GL_CULL_FACE);
    mMaterial.program->setUniformBuffer("uLighting", pass.lightingUniforms);
    auto shader = mMaterial.program->use();
    mMaterial.apply(shader, pass);
    mVao->bind().draw(mCount);
}

EdgeLineBatch::EdgeLineBatch(const EdgeLineMaterial &material, const Topology::Instance &topology)
  : mMaterial{material}
{
    Stage::replicate(std::vector<float>(topology.edges.size(), 0.f), Stage::verticesPerPrimitive(Stage::Kind::Edges), mExpanded);
    mVisibilityBuffer = glow::ArrayBuffer::create("aVisibility", mExpanded);
    mVao = glow::VertexArray::create({
        glow::ArrayBuffer::create("aPosition", Stage::drawPositions(Stage::Kind::Edges, topology)),
        mVisibilityBuffer
    }, nullptr, GL_LINES);
}

void EdgeLineBatch::upload(const std::vector<float> &scalars) {
    Stage::replicate(scalars, Stage::verticesPerPrimitive(Stage::Kind::Edges), mExpanded);
    mVisibilityBuffer->bind().setData(mExpanded);
}

void EdgeLineBatch::render(MainRenderPass &pass) {
    GLOW_SCOPED(enable, GL_DEPTH_TEST);
    GLOW_SCOPED(enable, GL_BLEND);
    GLOW_SCOPED(blendFunc, GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
    // wide lines are optional in core profiles, drivers clamp to their maximum
    GLOW_SCOPED(lineWidth, mMaterial.lineWidth);
    auto shader = mMaterial.program->use();
    mMaterial.apply(shader, pass);
    mVao->bind().draw();
}

FaceFillBatch::FaceFillBatch(const FaceFillMaterial &material, const Topology::Instance &topology)
  : mMaterial{material}
{
    Stage::replicate(std::vector<float>(topology.faces.size(), 0.f), Stage::verticesPerPrimitive(Stage::Kind::Faces), mExpanded);
    mVisibilityBuffer = glow::ArrayBuffer::create("aVisibility", mExpanded);
    mVao = glow::VertexArray::create({
        glow::ArrayBuffer::create("aPosition", Stage::drawPositions(Stage::Kind::Faces, topology)),
        mVisibilityBuffer
    }, nullptr, GL_TRIANGLES);
}

void FaceFillBatch::upload(const std::vector<float> &scalars) {
    Stage::replicate(scalars, Stage::verticesPerPrimitive(Stage::Kind::Faces), mExpanded);
    mVisibilityBuffer->bind().setData(mExpanded);
}

void FaceFillBatch::render(MainRenderPass &pass) {
    GLOW_SCOPED(enable, GL_DEPTH_TEST);
    GLOW_SCOPED(disable, GL_CULL_FACE);
    GLOW_SCOPED(enable, GL_BLEND);
    GLOW_SCOPED(blendFunc, GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
    // transparent, leave the depth buffer to what is drawn behind
    GLOW_SCOPED(depthMask, GL_FALSE);
    auto shader = mMaterial.program->use();
    mMaterial.apply(shader, pass);
    mVao->bind().draw();
}

AssembledSurface::AssembledSurface(const DissolveMaterial &material, const Topology::Instance &topology)
  : mMaterial{material}
{
    struct Corner {
        tg::pos3 position;
        tg::vec3 normal;
    };
    std::vector<Corner> corners;
    corners.reserve(3 * topology.faces.size());
    for (auto &face : topology.faces) {
        auto &p0 = topology.vertices[face[0]];
        auto &p1 = topology.vertices[face[1]];
        auto &p2 = topology.vertices[face[2]];
        auto normal = Util::triangleNormal(p0, p1, p2);
        corners.push_back({p0, normal});
        corners.push_back({p1, normal});
        corners.push_back({p2, normal});
    }
    mVao = glow::VertexArray::create(glow::ArrayBuffer::create({
        {&Corner::position, "aPosition"},
        {&Corner::normal, "aNormal"},
    }, corners), nullptr, GL_TRIANGLES);
}

void AssembledSurface::render(MainRenderPass &pass) {
    GLOW_SCOPED(enable, GL_DEPTH_TEST);
    // discarded fragments open the surface, its inside has to be drawn too
    GLOW_SCOPED(disable, GL_CULL_FACE);
    mMaterial.program->setUniformBuffer("uLighting", pass.lightingUniforms);
    auto shader = mMaterial.program->use();
    mMaterial.apply(shader, pass);
    shader["uDissolve"] = mThreshold;
    mVao->bind().draw();
}
