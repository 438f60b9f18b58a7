// SPDX-License-Identifier: MIT
#include "Topology.hh"

#include <unordered_set>

#include <glow/common/log.hh>

#include <Util.hh>

namespace Topology {

Edge canonicalEdge(uint32_t a, uint32_t b) {
    return Util::ordered(a, b);
}

namespace {

bool isDegenerate(const Face &face) {
    return face[0] == face[1] || face[1] == face[2] || face[2] == face[0];
}

void collectEdges(Instance &topology) {
    std::unordered_set<uint64_t> seen;
    seen.reserve(topology.faces.size() * 3);
    topology.edges.reserve(topology.faces.size() * 3 / 2 + 1);
    for (auto &face : topology.faces) {
        for (auto i : Util::IntRange(3)) {
            auto edge = canonicalEdge(face[i], face[(i + 1) % 3]);
            if (seen.insert(Util::packPair(edge)).second)
                topology.edges.push_back(edge);
        }
    }
}

}

std::optional<Instance> extract(const std::vector<tg::pos3> &positions, const std::optional<std::vector<uint32_t>> &indices) {
    Instance topology;
    if (positions.empty())
        return topology;

    auto vertexCount = positions.size();
    auto cornerCount = indices ? indices->size() : vertexCount;
    if (cornerCount % 3 != 0) {
        glow::error() << (indices ? "index count " : "vertex count ") << cornerCount << " is not a multiple of 3, mesh rejected";
        return std::nullopt;
    }
    if (indices) {
        for (auto idx : *indices) {
            if (idx >= vertexCount) {
                glow::error() << "index " << idx << " out of range for " << vertexCount << " vertices, mesh rejected";
                return std::nullopt;
            }
        }
    }

    topology.vertices = positions;
    topology.faces.reserve(cornerCount / 3);
    size_t nDegenerate = 0;
    for (size_t i = 0; i < cornerCount; i += 3) {
        Face face;
        for (auto k : Util::IntRange(3))
            face[k] = indices ? (*indices)[i + k] : uint32_t(i + k);

        if (isDegenerate(face)) {
            ++nDegenerate;
            continue;
        }
        topology.faces.push_back(face);
    }
    if (nDegenerate > 0)
        glow::warning() << "dropped " << nDegenerate << " degenerate triangles";

    collectEdges(topology);
    return topology;
}

}
