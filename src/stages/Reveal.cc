// SPDX-License-Identifier: MIT
#include "Reveal.hh"

#include <glow/common/log.hh>

#include <topology/MeshSource.hh>

namespace Reveal {

System::System(AnimatorManager &animators, Backend &backend, Settings settings)
  : mVertices(Stage::Kind::Vertices, animators, backend, settings.vertexTiming),
    mEdges(Stage::Kind::Edges, animators, backend, settings.edgeTiming),
    mFaces(Stage::Kind::Faces, animators, backend, settings.faceTiming),
    mAssembler(animators, backend),
    settings{settings} {}

bool System::loadMesh(const MeshSource::MeshData &mesh) {
    reset();
    mTopology = Topology::extract(mesh.positions, mesh.indices);
    if (!mTopology) {
        mMeshName.clear();
        glow::error() << "Mesh " << mesh.name << " was rejected";
        return false;
    }
    mMeshName = mesh.name;
    glow::info() << "Loaded " << mMeshName << ": " << mTopology->vertices.size() << " vertices, "
                 << mTopology->edges.size() << " edges, " << mTopology->faces.size() << " faces";
    return true;
}

void System::toggleVertices() {
    mVertices.timing = settings.vertexTiming;
    mVertices.toggle(topology(), settings.totalBudget);
}

void System::toggleEdges() {
    mEdges.timing = settings.edgeTiming;
    mEdges.toggle(topology(), settings.totalBudget);
}

void System::toggleFaces() {
    mFaces.timing = settings.faceTiming;
    mFaces.toggle(topology(), settings.totalBudget);
}

void System::toggleAssembled() {
    mAssembler.toggle(topology(), settings.totalBudget);
}

void System::reset() {
    mVertices.reset();
    mEdges.reset();
    mFaces.reset();
    mAssembler.reset();
    glow::info() << "Reset all stages";
}

void System::flush() {
    mVertices.flush();
    mEdges.flush();
    mFaces.flush();
    mAssembler.flush();
}

void System::render(MainRenderPass &pass) {
    mAssembler.render(pass);
    mVertices.render(pass);
    mEdges.render(pass);
    // blended, drawn last
    mFaces.render(pass);
}

bool System::isAnimating() const {
    return mVertices.isAnimating() || mEdges.isAnimating() || mFaces.isAnimating() || mAssembler.isAnimating();
}

}
