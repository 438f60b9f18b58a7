// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>

#include <animation/AnimatorManager.hh>
#include <stages/Dissolve.hh>
#include "FakeBackend.hh"

using Dissolve::State;

namespace {

std::vector<tg::pos3> samplePositions() {
    std::vector<tg::pos3> positions;
    for (int x = -10; x <= 10; ++x)
        for (int y = -10; y <= 10; ++y)
            for (int z = -3; z <= 3; ++z)
                positions.push_back(tg::pos3(x * .137f, y * .071f, z * .29f));
    return positions;
}

}

TEST(DissolveHash, InUnitInterval)
{
    for (auto p : samplePositions()) {
        auto h = Dissolve::hash(p, 40.f);
        EXPECT_GE(h, 0.f);
        EXPECT_LT(h, 1.f);
    }
}

TEST(DissolveHash, ConstantWithinCell)
{
    EXPECT_EQ(Dissolve::hash(tg::pos3(.101f, .201f, .301f), 10.f), Dissolve::hash(tg::pos3(.109f, .209f, .309f), 10.f));
    EXPECT_EQ(Dissolve::hash(tg::pos3(-.35f, 0, 0), 4.f), Dissolve::hash(tg::pos3(-.3f, .2f, .2f), 4.f));
}

TEST(DissolveHash, VariesBetweenCells)
{
    int distinct = 0;
    auto first = Dissolve::hash(tg::pos3(0, 0, 0), 10.f);
    for (int i = 1; i < 50; ++i)
        distinct += Dissolve::hash(tg::pos3(i * .1f + .05f, 0, 0), 10.f) != first;
    EXPECT_GT(distinct, 45);
}

TEST(DissolveHash, BoundaryThresholds)
{
    int positive = 0;
    for (auto p : samplePositions()) {
        auto h = Dissolve::hash(p, 40.f);
        EXPECT_FALSE(Dissolve::discards(h, 1.f));
        if (h > 0.f) {
            ++positive;
            EXPECT_TRUE(Dissolve::discards(h, 0.f));
        }
    }
    EXPECT_GT(positive, 0);
}

TEST(DissolveAssembler, NoFaces_NoOp)
{
    AnimatorManager animators;
    RecordingBackend backend;
    Dissolve::Assembler assembler(animators, backend);

    assembler.toggle(nullptr, 1.f);
    Topology::Instance empty;
    assembler.toggle(&empty, 1.f);

    EXPECT_EQ(assembler.state(), State::Absent);
    EXPECT_EQ(backend.surfacesCreated, 0);
}

TEST(DissolveAssembler, Instantaneous_Cycle)
{
    AnimatorManager animators;
    RecordingBackend backend;
    auto cube = cubeTopology();
    Dissolve::Assembler assembler(animators, backend);

    assembler.toggle(&cube, 0.f);
    EXPECT_EQ(assembler.state(), State::Solid);
    EXPECT_EQ(assembler.dissolve(), 1.f);
    EXPECT_TRUE(recorded(assembler.surface())->visible);
    EXPECT_EQ(recorded(assembler.surface())->threshold, 1.f);

    assembler.toggle(&cube, 0.f);
    EXPECT_EQ(assembler.state(), State::Vanished);
    EXPECT_EQ(assembler.dissolve(), 0.f);
    EXPECT_FALSE(recorded(assembler.surface())->visible);

    assembler.toggle(&cube, 0.f);
    EXPECT_EQ(assembler.state(), State::Solid);
    EXPECT_TRUE(recorded(assembler.surface())->visible);
    EXPECT_EQ(backend.surfacesCreated, 1);
}

TEST(DissolveAssembler, Animated_AssembleVanishReassemble)
{
    AnimatorManager animators;
    RecordingBackend backend;
    auto cube = cubeTopology();
    Dissolve::Assembler assembler(animators, backend);

    assembler.toggle(&cube, 1.f);
    EXPECT_EQ(assembler.state(), State::Dissolving);
    EXPECT_EQ(recorded(assembler.surface())->threshold, 0.f);
    EXPECT_TRUE(recorded(assembler.surface())->visible);

    advance(animators, .5f);
    assembler.flush();
    EXPECT_GT(assembler.dissolve(), 0.f);
    EXPECT_LT(assembler.dissolve(), 1.f);
    EXPECT_EQ(recorded(assembler.surface())->threshold, assembler.dissolve());

    advance(animators, .6f);
    assembler.flush();
    EXPECT_EQ(assembler.state(), State::Solid);
    EXPECT_EQ(recorded(assembler.surface())->threshold, 1.f);

    assembler.toggle(&cube, 1.f);
    EXPECT_EQ(assembler.state(), State::Vanishing);
    advance(animators, .5f);
    EXPECT_TRUE(recorded(assembler.surface())->visible);
    advance(animators, .6f);
    EXPECT_EQ(assembler.state(), State::Vanished);
    EXPECT_FALSE(recorded(assembler.surface())->visible);
    EXPECT_EQ(assembler.dissolve(), 0.f);

    assembler.toggle(&cube, 1.f);
    EXPECT_EQ(assembler.state(), State::Dissolving);
    EXPECT_TRUE(recorded(assembler.surface())->visible);
    advance(animators, 1.1f);
    EXPECT_EQ(assembler.state(), State::Solid);
}

TEST(DissolveAssembler, VanishMidAssembly_TurnsAround)
{
    AnimatorManager animators;
    RecordingBackend backend;
    auto cube = cubeTopology();
    Dissolve::Assembler assembler(animators, backend);

    assembler.toggle(&cube, 1.f);
    advance(animators, .5f);
    auto reached = assembler.dissolve();
    assembler.toggle(&cube, 1.f);
    EXPECT_EQ(assembler.state(), State::Vanishing);

    animators.updateAllAnimators(1.f / 60);
    EXPECT_LE(assembler.dissolve(), reached);
    advance(animators, 1.1f);
    EXPECT_EQ(assembler.state(), State::Vanished);
    EXPECT_EQ(animators.activeCount(), 0u);
}

TEST(DissolveAssembler, Reset_BackToAbsent)
{
    AnimatorManager animators;
    RecordingBackend backend;
    auto cube = cubeTopology();
    Dissolve::Assembler assembler(animators, backend);

    assembler.toggle(&cube, 1.f);
    advance(animators, .2f);
    assembler.reset();

    EXPECT_EQ(assembler.state(), State::Absent);
    EXPECT_EQ(assembler.surface(), nullptr);
    EXPECT_EQ(assembler.dissolve(), 0.f);
    advance(animators, 1.f);
    EXPECT_EQ(animators.activeCount(), 0u);
}
