// SPDX-License-Identifier: MIT
#pragma once

#include <memory>
#include <vector>

#include <fwd.hh>

namespace Stage {

enum class Kind {
    Vertices,
    Edges,
    Faces
};

/// All primitives of one kind, drawn with a single draw call.
/// Every primitive has one animation scalar, the batch spreads it over its draw vertices.
class Batch {
public:
    virtual ~Batch() = default;
    virtual void setVisible(bool visible) = 0;
    virtual bool isVisible() const = 0;
    /// one scalar per primitive, in topology order
    virtual void upload(const std::vector<float> &scalars) = 0;
    virtual void render(MainRenderPass &) {}
};

}

namespace Dissolve {

/// the fully shaded mesh, fragments with a hash above the threshold are discarded
class Surface {
public:
    virtual ~Surface() = default;
    virtual void setVisible(bool visible) = 0;
    virtual bool isVisible() const = 0;
    virtual void setThreshold(float threshold) = 0;
    virtual void render(MainRenderPass &) {}
};

}

namespace Reveal {

/// creates the drawables the stages animate
class Backend {
public:
    virtual ~Backend() = default;
    virtual std::unique_ptr<Stage::Batch> createBatch(Stage::Kind kind, const Topology::Instance &topology) = 0;
    virtual std::unique_ptr<Dissolve::Surface> createSurface(const Topology::Instance &topology) = 0;
};

}
