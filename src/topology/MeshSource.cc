// SPDX-License-Identifier: MIT
#include "MeshSource.hh"

#include <array>
#include <fstream>

#include <glow/common/log.hh>
#include <polymesh/formats/obj.hh>
#include <typed-geometry/tg.hh>

#include <Util.hh>

namespace MeshSource {

const char *shapeName(Shape shape) {
    switch (shape) {
    case Shape::Box: return "Box";
    case Shape::Cylinder: return "Cylinder";
    case Shape::Cone: return "Cone";
    case Shape::Sphere: return "Sphere";
    }
    return "?";
}

MeshData flatten(const pm::Mesh &mesh, const pm::vertex_attribute<tg::pos3> &position, std::string name) {
    MeshData data;
    data.name = std::move(name);
    data.positions.reserve(mesh.vertices().size());
    for (auto v : mesh.vertices())
        data.positions.push_back(position[v]);

    std::vector<uint32_t> indices;
    indices.reserve(3 * (mesh.halfedges().size() - 2 * mesh.faces().size()));
    for (auto f : mesh.faces()) {
        auto iter = f.vertices().begin();
        uint32_t first_idx = (*iter).idx.value;
        ++iter;
        uint32_t last_idx = (*iter).idx.value;
        while (true) {  /* "fan" triangulation */
            ++iter;
            if (iter == f.vertices().end()) {break;}
            uint32_t idx = (*iter).idx.value;
            indices.push_back(first_idx);
            indices.push_back(last_idx);
            indices.push_back(idx);
            last_idx = idx;
        }
    }
    data.indices = std::move(indices);
    return data;
}

namespace {

MeshData box() {
    pm::Mesh mesh;
    auto position = mesh.vertices().make_attribute<tg::pos3>();
    for (auto i : Util::IntRange(8)) {
        auto v = mesh.vertices().add();
        position[v] = tg::pos3(i & 1 ? 1 : -1, i & 2 ? 1 : -1, i & 4 ? 1 : -1);
    }
    static constexpr std::array<std::array<int, 4>, 6> quads {{
        {0, 4, 6, 2},  // -x
        {1, 3, 7, 5},  // +x
        {0, 1, 5, 4},  // bottom
        {2, 6, 7, 3},  // top
        {0, 2, 3, 1},  // back
        {4, 5, 7, 6},  // front
    }};
    for (auto &q : quads) {
        auto v = [&] (int i) {
            return mesh.handle_of(pm::vertex_index(q[i]));
        };
        mesh.faces().add(v(0), v(1), v(2), v(3));
    }
    return flatten(mesh, position, "Box");
}

/// ring of `segments` vertices at height y, first vertex on +z
std::vector<pm::vertex_handle> addRing(pm::Mesh &mesh, pm::vertex_attribute<tg::pos3> &position, int segments, float radius, float y) {
    std::vector<pm::vertex_handle> ring;
    ring.reserve(segments);
    for (auto s : Util::IntRange(segments)) {
        auto [sin, cos] = tg::sin_cos(360_deg * float(s) / float(segments));
        auto v = mesh.vertices().add();
        position[v] = tg::pos3(radius * sin, y, radius * cos);
        ring.push_back(v);
    }
    return ring;
}

/// open side between two rings, `lower` and `upper` of equal size
void addBand(pm::Mesh &mesh, const std::vector<pm::vertex_handle> &lower, const std::vector<pm::vertex_handle> &upper) {
    auto n = lower.size();
    for (size_t s = 0; s < n; ++s) {
        auto next = (s + 1) % n;
        mesh.faces().add(lower[s], lower[next], upper[next], upper[s]);
    }
}

/// fan around `center`, facing up if `up`, else down
void addCap(pm::Mesh &mesh, pm::vertex_handle center, const std::vector<pm::vertex_handle> &ring, bool up) {
    auto n = ring.size();
    for (size_t s = 0; s < n; ++s) {
        auto next = (s + 1) % n;
        if (up)
            mesh.faces().add(center, ring[s], ring[next]);
        else
            mesh.faces().add(center, ring[next], ring[s]);
    }
}

MeshData cylinder(float radius, float height, int segments) {
    pm::Mesh mesh;
    auto position = mesh.vertices().make_attribute<tg::pos3>();
    auto bottom = addRing(mesh, position, segments, radius, -height / 2);
    auto top = addRing(mesh, position, segments, radius, height / 2);
    auto bottomCenter = mesh.vertices().add();
    position[bottomCenter] = tg::pos3(0, -height / 2, 0);
    auto topCenter = mesh.vertices().add();
    position[topCenter] = tg::pos3(0, height / 2, 0);

    addBand(mesh, bottom, top);
    addCap(mesh, topCenter, top, true);
    addCap(mesh, bottomCenter, bottom, false);
    return flatten(mesh, position, "Cylinder");
}

MeshData cone(float radius, float height, int segments) {
    pm::Mesh mesh;
    auto position = mesh.vertices().make_attribute<tg::pos3>();
    auto base = addRing(mesh, position, segments, radius, -height / 2);
    auto apex = mesh.vertices().add();
    position[apex] = tg::pos3(0, height / 2, 0);
    auto baseCenter = mesh.vertices().add();
    position[baseCenter] = tg::pos3(0, -height / 2, 0);

    for (size_t s = 0; s < base.size(); ++s)
        mesh.faces().add(base[s], base[(s + 1) % base.size()], apex);
    addCap(mesh, baseCenter, base, false);
    return flatten(mesh, position, "Cone");
}

}

MeshData sphere(float radius, int widthSegments, int heightSegments, std::string name) {
    pm::Mesh mesh;
    auto position = mesh.vertices().make_attribute<tg::pos3>();
    auto topPole = mesh.vertices().add();
    position[topPole] = tg::pos3(0, radius, 0);

    std::vector<std::vector<pm::vertex_handle>> rings;
    for (auto r : Util::IntRange(1, heightSegments)) {
        auto [sin, cos] = tg::sin_cos(180_deg * float(r) / float(heightSegments));
        rings.push_back(addRing(mesh, position, widthSegments, radius * sin, radius * cos));
    }
    auto bottomPole = mesh.vertices().add();
    position[bottomPole] = tg::pos3(0, -radius, 0);

    addCap(mesh, topPole, rings.front(), true);
    for (size_t r = 0; r + 1 < rings.size(); ++r)
        addBand(mesh, rings[r + 1], rings[r]);
    addCap(mesh, bottomPole, rings.back(), false);
    return flatten(mesh, position, std::move(name));
}

MeshData buildShape(Shape shape) {
    switch (shape) {
    case Shape::Box: return box();
    case Shape::Cylinder: return cylinder(1, 2, 16);
    case Shape::Cone: return cone(1, 2, 16);
    case Shape::Sphere: return sphere(1, 16, 16);
    }
    return box();
}

std::optional<MeshData> loadObj(const std::string &filename) {
    if (!std::ifstream(filename).good())
    {
        glow::error() << filename << " cannot be opened";
        return std::nullopt;
    }

    pm::Mesh mesh;
    pm::obj_reader<float> obj_reader(filename, mesh);
    if (obj_reader.error_faces() > 0)
    {
        glow::error() << filename << " contains " << obj_reader.error_faces() << " faces that could not be added";
        return std::nullopt;
    }
    if (!obj_reader.has_valid_normals())
        glow::warning() << "Mesh " << filename << " has no normals, faces are shaded flat";

    auto position = obj_reader.get_positions().to<tg::pos3>();
    return flatten(mesh, position, filename);
}

}
