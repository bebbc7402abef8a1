#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>

#include "comparison.hpp"
#include "registry.hpp"
#include "test_helpers.hpp"

using namespace orbitwatch;
using namespace orbitwatch::test;

namespace {

// Equal-mass binary released at 0.8 of circular speed.
entt::registry EccentricBinary() {
    auto registry = MakeRegistry();
    const double v = 0.8 * std::sqrt(0.5 * 1000.0 / (2.0 * 100.0));
    AddMover(registry, "A", {-50, 0}, {0, -v}, 1000.0, 5.0);
    AddMover(registry, "B", {50, 0}, {0, v}, 1000.0, 5.0);
    return registry;
}

} // namespace

TEST(Comparison, SampleCadence) {
    auto registry = EccentricBinary();
    const auto result = RunComparison(registry, 0.2, 300, 5);

    ASSERT_EQ(result.samples.size(), 60u);
    EXPECT_EQ(result.samples[0].step, 0);
    EXPECT_EQ(result.samples[1].step, 5);
    EXPECT_EQ(result.samples.back().step, 295);
    EXPECT_LT(result.initial_energy, 0.0);
}

TEST(Comparison, EulerDriftsMost) {
    auto registry = EccentricBinary();
    const auto result = RunComparison(registry, 0.2, 300, 5);

    double euler = 0.0;
    double rk4 = 0.0;
    double verlet = 0.0;
    for (const auto& sample : result.samples) {
        euler = std::max(euler, sample.euler);
        rk4 = std::max(rk4, sample.rk4);
        verlet = std::max(verlet, sample.verlet);
    }

    EXPECT_LT(result.samples.back().verlet, 5.0);
    EXPECT_GT(euler, verlet);
    EXPECT_GT(euler, rk4);
}

TEST(Comparison, NeedsTwoBodies) {
    auto registry = MakeRegistry();
    AddMover(registry, "A", {0, 0}, {1, 0});

    const auto result = RunComparison(registry, 0.2);
    EXPECT_TRUE(result.samples.empty());
}

TEST(Comparison, RunsOnClones) {
    auto registry = EccentricBinary();
    registry.ctx().get<PhysicsSettings>().drag_enabled = true;
    const auto before = TakeSnapshot(registry);

    RunComparison(registry, 0.2, 50, 10);

    const auto after = TakeSnapshot(registry);
    EXPECT_EQ(before[0].position.x, after[0].position.x);
    EXPECT_EQ(before[1].velocity.y, after[1].velocity.y);
    EXPECT_TRUE(registry.ctx().get<PhysicsSettings>().drag_enabled);
}
