// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>

#include <algorithm>

#include <animation/AnimatorManager.hh>
#include <stages/Stage.hh>
#include "FakeBackend.hh"

using Stage::Kind;
using Stage::Visibility;

namespace {

Stage::Timing edgeTiming() {
    return {.3f, AnimationEasing::easeOut};
}

bool allEqual(const std::vector<float> &values, float expected) {
    return std::all_of(values.begin(), values.end(), [&](float v) {return v == expected;});
}

}

TEST(StageController, NoTopology_NoOp)
{
    AnimatorManager animators;
    RecordingBackend backend;
    Stage::Controller edges(Kind::Edges, animators, backend, edgeTiming());

    edges.toggle(nullptr, 1.f);
    Topology::Instance empty;
    edges.toggle(&empty, 1.f);

    EXPECT_EQ(edges.visibility(), Visibility::Uninitialized);
    EXPECT_FALSE(edges.isBuilt());
    EXPECT_EQ(backend.batchesCreated, 0);
}

TEST(StageController, FirstToggle_BuildsOneBatchForAllPrimitives)
{
    AnimatorManager animators;
    RecordingBackend backend;
    auto cube = cubeTopology();
    Stage::Controller faces(Kind::Faces, animators, backend, {.4f, AnimationEasing::easeOut});

    faces.toggle(&cube, 1.f);

    ASSERT_TRUE(faces.isBuilt());
    EXPECT_EQ(backend.batchesCreated, 1);
    auto batch = recorded(faces.batch());
    EXPECT_EQ(batch->kind, Kind::Faces);
    EXPECT_EQ(batch->primitiveCount, 12u);
    EXPECT_EQ(faces.scalars().size(), 12u);
    // built with every scalar at zero
    EXPECT_EQ(batch->uploads, 1);
    EXPECT_TRUE(allEqual(batch->uploaded, 0.f));
}

TEST(StageController, Instantaneous_FinalValuesOnReturn)
{
    AnimatorManager animators;
    RecordingBackend backend;
    auto cube = cubeTopology();
    Stage::Controller vertices(Kind::Vertices, animators, backend, {.5f, AnimationEasing::backOut});

    vertices.toggle(&cube, 0.f);
    EXPECT_EQ(vertices.visibility(), Visibility::Shown);
    EXPECT_FALSE(vertices.isAnimating());
    EXPECT_TRUE(allEqual(vertices.scalars(), 1.f));
    EXPECT_TRUE(recorded(vertices.batch())->visible);
    EXPECT_TRUE(allEqual(recorded(vertices.batch())->uploaded, 1.f));

    vertices.toggle(&cube, 0.f);
    EXPECT_EQ(vertices.visibility(), Visibility::Hidden);
    EXPECT_EQ(vertices.scalars().size(), 8u);
    EXPECT_TRUE(allEqual(vertices.scalars(), 0.f));
    EXPECT_FALSE(recorded(vertices.batch())->visible);
    EXPECT_EQ(animators.activeCount(), 0u);
}

TEST(StageController, Show_AnimatesEveryScalarToOne)
{
    AnimatorManager animators;
    RecordingBackend backend;
    auto cube = cubeTopology();
    Stage::Controller edges(Kind::Edges, animators, backend, edgeTiming());

    edges.toggle(&cube, 1.f);
    EXPECT_EQ(edges.visibility(), Visibility::Shown);
    EXPECT_TRUE(edges.isAnimating());
    EXPECT_TRUE(recorded(edges.batch())->visible);

    advance(animators, .5f);
    edges.flush();
    // forward wave: lower indices are further along
    EXPECT_GE(edges.scalars().front(), edges.scalars().back());
    EXPECT_GT(edges.scalars().front(), 0.f);

    advance(animators, .6f);
    edges.flush();
    EXPECT_FALSE(edges.isAnimating());
    EXPECT_TRUE(allEqual(edges.scalars(), 1.f));
    EXPECT_TRUE(allEqual(recorded(edges.batch())->uploaded, 1.f));
}

TEST(StageController, Flush_UploadsOnlyAfterChanges)
{
    AnimatorManager animators;
    RecordingBackend backend;
    auto cube = cubeTopology();
    Stage::Controller edges(Kind::Edges, animators, backend, edgeTiming());

    edges.toggle(&cube, 1.f);
    auto batch = recorded(edges.batch());
    auto uploads = batch->uploads;

    edges.flush();
    EXPECT_EQ(batch->uploads, uploads);

    animators.updateAllAnimators(.1f);
    edges.flush();
    edges.flush();
    EXPECT_EQ(batch->uploads, uploads + 1);
}

TEST(StageController, Hide_HidesBatchWhenLastTweenCompletes)
{
    AnimatorManager animators;
    RecordingBackend backend;
    auto cube = cubeTopology();
    Stage::Controller edges(Kind::Edges, animators, backend, edgeTiming());

    edges.toggle(&cube, 1.f);
    advance(animators, 1.1f);
    edges.toggle(&cube, 1.f);
    EXPECT_EQ(edges.visibility(), Visibility::Hidden);

    advance(animators, .5f);
    EXPECT_TRUE(recorded(edges.batch())->visible);
    EXPECT_TRUE(edges.isAnimating());
    // reverse wave: the last index starts first
    EXPECT_LE(edges.scalars().back(), edges.scalars().front());

    advance(animators, .6f);
    edges.flush();
    EXPECT_FALSE(recorded(edges.batch())->visible);
    EXPECT_FALSE(edges.isAnimating());
}

TEST(StageController, ShowThenHide_RestoresInitialState)
{
    AnimatorManager animators;
    RecordingBackend backend;
    auto cube = cubeTopology();
    Stage::Controller vertices(Kind::Vertices, animators, backend, {.5f, AnimationEasing::backOut});

    vertices.toggle(&cube, 1.f);
    advance(animators, 1.1f);
    vertices.toggle(&cube, 1.f);
    advance(animators, 1.1f);
    vertices.flush();

    EXPECT_EQ(vertices.visibility(), Visibility::Hidden);
    EXPECT_FALSE(recorded(vertices.batch())->visible);
    EXPECT_TRUE(allEqual(vertices.scalars(), 0.f));
    EXPECT_TRUE(allEqual(recorded(vertices.batch())->uploaded, 0.f));
    EXPECT_EQ(backend.batchesCreated, 1);
}

TEST(StageController, ToggleMidFlight_CancelsPreviousWave)
{
    AnimatorManager animators;
    RecordingBackend backend;
    auto cube = cubeTopology();
    Stage::Controller edges(Kind::Edges, animators, backend, edgeTiming());

    edges.toggle(&cube, 1.f);
    advance(animators, .5f);
    EXPECT_EQ(animators.activeCount() > 0, true);

    edges.toggle(&cube, 1.f);
    EXPECT_EQ(edges.visibility(), Visibility::Hidden);
    EXPECT_EQ(animators.activeCount(), edges.scalars().size());

    // nothing of the cancelled show wave may push a scalar up again
    auto previous = edges.scalars();
    for (int frame = 0; frame < 90; ++frame) {
        animators.updateAllAnimators(1.f / 60);
        for (size_t i = 0; i < previous.size(); ++i)
            EXPECT_LE(edges.scalars()[i], previous[i] + 1e-6f);
        previous = edges.scalars();
    }
    EXPECT_TRUE(allEqual(edges.scalars(), 0.f));
    EXPECT_FALSE(recorded(edges.batch())->visible);
    EXPECT_EQ(animators.activeCount(), 0u);
}

TEST(StageController, ShowDuringHide_KeepsBatchVisible)
{
    AnimatorManager animators;
    RecordingBackend backend;
    auto cube = cubeTopology();
    Stage::Controller edges(Kind::Edges, animators, backend, edgeTiming());

    edges.toggle(&cube, 1.f);
    advance(animators, 1.1f);
    edges.toggle(&cube, 1.f);
    advance(animators, .3f);
    edges.toggle(&cube, 1.f);
    advance(animators, 1.1f);

    EXPECT_EQ(edges.visibility(), Visibility::Shown);
    EXPECT_TRUE(recorded(edges.batch())->visible);
    EXPECT_TRUE(allEqual(edges.scalars(), 1.f));
}

TEST(StageController, Reset_ReleasesBatchAndTweens)
{
    AnimatorManager animators;
    RecordingBackend backend;
    auto cube = cubeTopology();
    Stage::Controller faces(Kind::Faces, animators, backend, {.4f, AnimationEasing::easeOut});

    faces.toggle(&cube, 1.f);
    advance(animators, .2f);
    faces.reset();

    EXPECT_EQ(faces.visibility(), Visibility::Uninitialized);
    EXPECT_FALSE(faces.isBuilt());
    EXPECT_FALSE(faces.isAnimating());
    EXPECT_TRUE(faces.scalars().empty());
    advance(animators, .1f);
    EXPECT_EQ(animators.activeCount(), 0u);

    faces.toggle(&cube, 0.f);
    EXPECT_EQ(backend.batchesCreated, 2);
    EXPECT_EQ(faces.visibility(), Visibility::Shown);
}

TEST(StageLayout, CubeEdges_TwoLineEndsPerEdge)
{
    auto cube = cubeTopology();
    ASSERT_EQ(cube.edges.size(), 18u);
    EXPECT_EQ(Stage::verticesPerPrimitive(Kind::Edges), 2u);

    std::vector<float> scalars(cube.edges.size());
    for (size_t i = 0; i < scalars.size(); ++i)
        scalars[i] = float(i);
    std::vector<float> replicated;
    Stage::replicate(scalars, Stage::verticesPerPrimitive(Kind::Edges), replicated);

    auto positions = Stage::drawPositions(Kind::Edges, cube);
    ASSERT_EQ(replicated.size(), 36u);
    ASSERT_EQ(positions.size(), 36u);
    for (size_t i = 0; i < cube.edges.size(); ++i) {
        EXPECT_EQ(replicated[2 * i], float(i));
        EXPECT_EQ(replicated[2 * i + 1], float(i));
        EXPECT_EQ(positions[2 * i], cube.vertices[cube.edges[i].first]);
        EXPECT_EQ(positions[2 * i + 1], cube.vertices[cube.edges[i].second]);
    }
}

TEST(StageLayout, CubeFaces_ThreeCornersPerFace)
{
    auto cube = cubeTopology();
    ASSERT_EQ(cube.faces.size(), 12u);
    EXPECT_EQ(Stage::verticesPerPrimitive(Kind::Faces), 3u);

    std::vector<float> scalars(cube.faces.size());
    for (size_t i = 0; i < scalars.size(); ++i)
        scalars[i] = .5f + float(i);
    std::vector<float> replicated;
    Stage::replicate(scalars, Stage::verticesPerPrimitive(Kind::Faces), replicated);

    auto positions = Stage::drawPositions(Kind::Faces, cube);
    ASSERT_EQ(replicated.size(), 36u);
    ASSERT_EQ(positions.size(), 36u);
    for (size_t i = 0; i < cube.faces.size(); ++i)
        for (size_t c = 0; c < 3; ++c) {
            EXPECT_EQ(replicated[3 * i + c], scalars[i]);
            EXPECT_EQ(positions[3 * i + c], cube.vertices[cube.faces[i][c]]);
        }
}

TEST(StageLayout, ReplicateReusesTheOutputBuffer)
{
    std::vector<float> out(100, 7.f);
    Stage::replicate({1.f, 0.f}, 3, out);
    EXPECT_EQ(out, (std::vector<float> {1.f, 1.f, 1.f, 0.f, 0.f, 0.f}));

    Stage::replicate({}, 2, out);
    EXPECT_TRUE(out.empty());
}

TEST(StageLayout, VerticesAreOneInstanceEach)
{
    auto cube = cubeTopology();
    EXPECT_EQ(Stage::verticesPerPrimitive(Kind::Vertices), 1u);
    EXPECT_EQ(Stage::drawPositions(Kind::Vertices, cube), cube.vertices);
}

TEST(StageController, ToggleWhilePaused_StartsOnResume)
{
    AnimatorManager animators;
    RecordingBackend backend;
    auto cube = cubeTopology();
    Stage::Controller vertices(Kind::Vertices, animators, backend, {.5f, AnimationEasing::backOut});

    animators.setPaused(true);
    vertices.toggle(&cube, 1.f);
    advance(animators, 2.f);
    vertices.flush();
    EXPECT_TRUE(vertices.isAnimating());
    EXPECT_TRUE(allEqual(vertices.scalars(), 0.f));

    animators.setPaused(false);
    advance(animators, 1.1f);
    vertices.flush();
    EXPECT_FALSE(vertices.isAnimating());
    EXPECT_TRUE(allEqual(recorded(vertices.batch())->uploaded, 1.f));
}
