// SPDX-License-Identifier: MIT
#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include <typed-geometry/tg-lean.hh>

namespace Topology {

/// one triangle, three distinct vertex indices
using Face = std::array<uint32_t, 3>;
/// unordered vertex pair, always stored as (min, max)
using Edge = std::pair<uint32_t, uint32_t>;

struct Instance {
    std::vector<tg::pos3> vertices;
    std::vector<Face> faces;
    /// unique, in order of first appearance while walking the faces
    std::vector<Edge> edges;

    bool empty() const {return vertices.empty();}
};

Edge canonicalEdge(uint32_t a, uint32_t b);

/// Derives vertices, faces and unique edges from a triangle soup or an indexed triangle list.
/// Returns nullopt (and logs why) if the input is not a valid triangle list,
/// empty input yields an empty instance.
std::optional<Instance> extract(const std::vector<tg::pos3> &positions, const std::optional<std::vector<uint32_t>> &indices);

}
