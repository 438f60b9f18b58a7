// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>

#include <cmath>
#include <fstream>
#include <string>

#include <topology/MeshSource.hh>
#include <topology/Topology.hh>

using MeshSource::Shape;

namespace {

struct Counts {
    size_t vertices, faces, edges;
};

Counts countsOf(const MeshSource::MeshData &mesh) {
    auto topology = Topology::extract(mesh.positions, mesh.indices);
    EXPECT_TRUE(topology.has_value());
    if (!topology)
        return {0, 0, 0};
    return {topology->vertices.size(), topology->faces.size(), topology->edges.size()};
}

}

TEST(MeshSource, Box)
{
    auto counts = countsOf(MeshSource::buildShape(Shape::Box));
    EXPECT_EQ(counts.vertices, 8u);
    EXPECT_EQ(counts.faces, 12u);
    EXPECT_EQ(counts.edges, 18u);
}

TEST(MeshSource, Cylinder)
{
    auto counts = countsOf(MeshSource::buildShape(Shape::Cylinder));
    EXPECT_EQ(counts.vertices, 34u);
    EXPECT_EQ(counts.faces, 64u);
    EXPECT_EQ(counts.edges, 96u);
}

TEST(MeshSource, Cone)
{
    auto counts = countsOf(MeshSource::buildShape(Shape::Cone));
    EXPECT_EQ(counts.vertices, 18u);
    EXPECT_EQ(counts.faces, 32u);
    EXPECT_EQ(counts.edges, 48u);
}

TEST(MeshSource, Sphere)
{
    auto counts = countsOf(MeshSource::buildShape(Shape::Sphere));
    EXPECT_EQ(counts.vertices, 242u);
    EXPECT_EQ(counts.faces, 480u);
    EXPECT_EQ(counts.edges, 720u);
}

TEST(MeshSource, ShapesFitTheirBounds)
{
    for (auto shape : MeshSource::allShapes) {
        auto mesh = MeshSource::buildShape(shape);
        EXPECT_EQ(mesh.name, MeshSource::shapeName(shape));
        ASSERT_TRUE(mesh.indices.has_value());
        for (auto &p : mesh.positions) {
            EXPECT_LE(std::abs(p.x), 1.f + 1e-5f);
            EXPECT_LE(std::abs(p.y), 1.f + 1e-5f);
            EXPECT_LE(std::abs(p.z), 1.f + 1e-5f);
        }
    }
}

TEST(MeshSource, LoadObj_MissingFile)
{
    EXPECT_FALSE(MeshSource::loadObj("does/not/exist.obj").has_value());
}

TEST(MeshSource, LoadObj_TriangulatesPolygons)
{
    auto path = ::testing::TempDir() + "mesh_source_quad_pyramid.obj";
    {
        std::ofstream out(path);
        out << "v -1 0 -1\nv 1 0 -1\nv 1 0 1\nv -1 0 1\nv 0 1 0\n"
            << "f 1 2 3 4\n"
            << "f 2 1 5\nf 3 2 5\nf 4 3 5\nf 1 4 5\n";
    }

    auto mesh = MeshSource::loadObj(path);
    ASSERT_TRUE(mesh.has_value());
    EXPECT_EQ(mesh->positions.size(), 5u);
    ASSERT_TRUE(mesh->indices.has_value());
    EXPECT_EQ(mesh->indices->size(), 18u);

    auto counts = countsOf(*mesh);
    EXPECT_EQ(counts.faces, 6u);
    EXPECT_EQ(counts.edges, 9u);
}
