#include <gtest/gtest.h>

#include <stdexcept>

#include "integrators.hpp"
#include "registry.hpp"
#include "systems.hpp"
#include "test_helpers.hpp"

using namespace orbitwatch;
using namespace orbitwatch::test;

TEST(Registry, RejectsInvalidBodies) {
    auto registry = MakeRegistry();
    AddMover(registry, "A", {0, 0}, {0, 0});

    BodySpec spec;
    spec.id = "";
    EXPECT_THROW(CreateBody(registry, spec), std::invalid_argument);

    spec.id = "B";
    spec.mass = 0.0;
    EXPECT_THROW(CreateBody(registry, spec), std::invalid_argument);

    spec.mass = 1.0;
    spec.radius = -1.0;
    EXPECT_THROW(CreateBody(registry, spec), std::invalid_argument);

    spec.id = "A";
    spec.radius = 1.0;
    EXPECT_THROW(CreateBody(registry, spec), std::invalid_argument);

    EXPECT_EQ(CountBodies(registry), 1u);
}

TEST(Registry, OrderedBodiesFollowSpawnOrder) {
    auto registry = MakeRegistry();
    AddFixed(registry, "EARTH", {0, 0});
    auto a = AddMover(registry, "A", {100, 0}, {0, 1});
    AddMover(registry, "B", {200, 0}, {0, 1});
    AddMover(registry, "C", {300, 0}, {0, 1});
    registry.destroy(a);
    AddMover(registry, "D", {400, 0}, {0, 1});

    auto snapshot = TakeSnapshot(registry);
    ASSERT_EQ(snapshot.size(), 4u);
    EXPECT_EQ(snapshot[0].id, "EARTH");
    EXPECT_EQ(snapshot[1].id, "B");
    EXPECT_EQ(snapshot[2].id, "C");
    EXPECT_EQ(snapshot[3].id, "D");
    EXPECT_TRUE(snapshot[0].fixed);
}

TEST(Registry, FindBodyAndFixedBody) {
    auto registry = MakeRegistry();
    EXPECT_EQ(FindFixedBody(registry), entt::null);

    auto sat = AddMover(registry, "SAT", {100, 0}, {0, 1});
    auto earth = AddFixed(registry, "EARTH", {0, 0});

    EXPECT_EQ(FindBody(registry, "SAT"), sat);
    EXPECT_EQ(FindBody(registry, "missing"), entt::null);
    EXPECT_EQ(FindFixedBody(registry), earth);
}

TEST(Registry, FixedBodiesIgnoreInitialVelocity) {
    auto registry = MakeRegistry();
    BodySpec spec;
    spec.id = "EARTH";
    spec.velocity = {3, 4};
    spec.fixed = true;
    auto earth = CreateBody(registry, spec);
    EXPECT_EQ(registry.get<Velocity>(earth).v.x, 0.0);
    EXPECT_EQ(registry.get<Velocity>(earth).v.y, 0.0);
}

TEST(Registry, SetBodyVelocityClearsTrail) {
    auto registry = MakeRegistry();
    AddFixed(registry, "EARTH", {0, 0});
    auto sat = AddCircular(registry, "SAT", {0, 0}, 200.0);
    UpdateTrailSystem(registry, 10);
    ASSERT_EQ(registry.get<Trail>(sat).points.size(), 1u);

    EXPECT_TRUE(SetBodyVelocity(registry, "SAT", {1, 2}));
    EXPECT_TRUE(registry.get<Trail>(sat).points.empty());
    EXPECT_EQ(registry.get<Velocity>(sat).v.x, 1.0);
    EXPECT_EQ(registry.get<Velocity>(sat).v.y, 2.0);

    EXPECT_FALSE(SetBodyVelocity(registry, "EARTH", {1, 2}));
    EXPECT_FALSE(SetBodyVelocity(registry, "missing", {1, 2}));
}

TEST(Registry, TrailIsBounded) {
    auto registry = MakeRegistry();
    auto earth = AddFixed(registry, "EARTH", {0, 0});
    auto sat = AddCircular(registry, "SAT", {0, 0}, 200.0);

    for (int i = 0; i < 25; ++i) {
        Step(registry, IntegratorKind::Verlet, 0.2);
        UpdateTrailSystem(registry, 10);
    }
    const auto& trail = registry.get<Trail>(sat).points;
    ASSERT_EQ(trail.size(), 10u);
    EXPECT_EQ(trail.back().x, registry.get<Position>(sat).p.x);
    EXPECT_TRUE(registry.get<Trail>(earth).points.empty());
}

TEST(Registry, CloneCopiesBodiesAndSettingsButNotTrails) {
    auto registry = MakeRegistry(true);
    AddFixed(registry, "EARTH", {0, 0});
    auto sat = AddCircular(registry, "SAT", {0, 0}, 200.0);
    UpdateTrailSystem(registry, 10);

    auto clone = CloneRegistry(registry);
    EXPECT_TRUE(clone.ctx().get<PhysicsSettings>().drag_enabled);

    auto original = TakeSnapshot(registry);
    auto copied = TakeSnapshot(clone);
    ASSERT_EQ(original.size(), copied.size());
    for (std::size_t i = 0; i < original.size(); ++i) {
        EXPECT_EQ(original[i].id, copied[i].id);
        EXPECT_EQ(original[i].position.x, copied[i].position.x);
        EXPECT_EQ(original[i].position.y, copied[i].position.y);
        EXPECT_EQ(original[i].velocity.x, copied[i].velocity.x);
        EXPECT_EQ(original[i].velocity.y, copied[i].velocity.y);
        EXPECT_EQ(original[i].mass, copied[i].mass);
        EXPECT_EQ(original[i].radius, copied[i].radius);
        EXPECT_EQ(original[i].fixed, copied[i].fixed);
        EXPECT_TRUE(copied[i].trail.empty());
    }
    EXPECT_FALSE(registry.get<Trail>(sat).points.empty());
}

TEST(Registry, AdvancingACloneLeavesTheOriginalUntouched) {
    auto registry = MakeRegistry();
    AddFixed(registry, "EARTH", {0, 0});
    AddCircular(registry, "SAT-1", {0, 0}, 150.0);
    AddCircular(registry, "SAT-2", {0, 0}, 250.0);
    UpdateTrailSystem(registry, 10);
    const auto before = TakeSnapshot(registry);

    {
        auto clone = CloneRegistry(registry);
        for (int i = 0; i < 50; ++i) {
            Step(clone, IntegratorKind::RK4, 0.4);
        }
        clone.ctx().get<PhysicsSettings>().drag_enabled = true;
        SetBodyVelocity(clone, "SAT-1", {0, 0});
    }

    const auto after = TakeSnapshot(registry);
    ASSERT_EQ(before.size(), after.size());
    for (std::size_t i = 0; i < before.size(); ++i) {
        EXPECT_EQ(before[i].id, after[i].id);
        EXPECT_EQ(before[i].position.x, after[i].position.x);
        EXPECT_EQ(before[i].position.y, after[i].position.y);
        EXPECT_EQ(before[i].velocity.x, after[i].velocity.x);
        EXPECT_EQ(before[i].velocity.y, after[i].velocity.y);
        EXPECT_EQ(before[i].mass, after[i].mass);
        EXPECT_EQ(before[i].radius, after[i].radius);
        EXPECT_EQ(before[i].fixed, after[i].fixed);
        EXPECT_EQ(before[i].trail.size(), after[i].trail.size());
    }
    EXPECT_FALSE(registry.ctx().get<PhysicsSettings>().drag_enabled);
}
