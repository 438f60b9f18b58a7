// SPDX-License-Identifier: MIT
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <polymesh/Mesh.hh>
#include <typed-geometry/tg-lean.hh>

namespace MeshSource {

enum class Shape {
    Box,
    Cylinder,
    Cone,
    Sphere
};
static constexpr Shape allShapes[] = {Shape::Box, Shape::Cylinder, Shape::Cone, Shape::Sphere};

const char *shapeName(Shape shape);

/// raw geometry handed to the topology extractor
struct MeshData {
    std::string name;
    std::vector<tg::pos3> positions;
    std::optional<std::vector<uint32_t>> indices;
};

/// the built-in shapes: 2x2x2 box, radius 1 / height 2 cylinder and cone
/// with 16 segments, unit sphere with 16x16 segments
MeshData buildShape(Shape shape);

/// welded UV sphere around the origin, two poles plus `heightSegments - 1` rings
MeshData sphere(float radius, int widthSegments, int heightSegments, std::string name = "Sphere");

/// reads a Wavefront OBJ, nullopt if the file cannot be read or has faces that could not be added
std::optional<MeshData> loadObj(const std::string &filename);

/// indexed triangle list of a polymesh mesh, polygons are fan-triangulated
MeshData flatten(const pm::Mesh &mesh, const pm::vertex_attribute<tg::pos3> &position, std::string name);

}
