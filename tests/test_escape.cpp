#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <limits>

#include "escape.hpp"
#include "registry.hpp"
#include "test_helpers.hpp"

using namespace orbitwatch;
using namespace orbitwatch::test;

TEST(Escape, CandidateGridOrder) {
    const auto candidates = EscapeCandidates({0.0, 5.0}, 6.0);

    // 1.1 * 5 and 1.15 * 5 exceed 0.9 * 6.
    ASSERT_EQ(candidates.size(), 35u);
    EXPECT_NEAR(candidates[0].x, 0.0, 1e-12);
    EXPECT_NEAR(candidates[0].y, 4.25, 1e-12);
    // Second entry turns by +0.1 rad at the same speed.
    EXPECT_NEAR(candidates[1].Length(), 4.25, 1e-12);
    EXPECT_NEAR(std::atan2(candidates[1].y, candidates[1].x), std::atan2(5.0, 0.0) + 0.1, 1e-12);
    EXPECT_NEAR(candidates[34].Length(), 5.25, 1e-12);
}

TEST(Escape, NoCandidatesAboveEscapeFraction) {
    EXPECT_TRUE(EscapeCandidates({10.0, 0.0}, 5.0).empty());
    EXPECT_EQ(EscapeCandidates({1.0, 0.0}, 100.0).size(), 49u);
}

TEST(Escape, StableOrbitKeepsItsCourse) {
    auto registry = MakeRegistry();
    AddFixed(registry, "EARTH", {0, 0});
    AddCircular(registry, "SAT", {0, 0}, 200.0);

    const auto plan = PlanEscape(registry, "SAT", 0.2);

    ASSERT_TRUE(plan.has_value());
    EXPECT_NEAR(plan->velocity.x, 0.0, 1e-9);
    EXPECT_NEAR(plan->velocity.y, 5.0, 1e-9);
    EXPECT_GT(plan->score, 390.0);
}

TEST(Escape, EveryCandidateDisqualified) {
    auto registry = MakeRegistry();
    AddFixed(registry, "EARTH", {0, 0});
    // Inside radius sum plus margin from the start.
    AddMover(registry, "SAT", {40, 0}, {0, 11});

    EXPECT_FALSE(PlanEscape(registry, "SAT", 0.2).has_value());
}

TEST(Escape, NothingToPlanFor) {
    auto registry = MakeRegistry();
    AddMover(registry, "SAT", {200, 0}, {0, 5});
    EXPECT_FALSE(PlanEscape(registry, "SAT", 0.2).has_value());

    AddFixed(registry, "EARTH", {0, 0});
    EXPECT_FALSE(PlanEscape(registry, "EARTH", 0.2).has_value());
    EXPECT_FALSE(PlanEscape(registry, "MISSING", 0.2).has_value());
}

TEST(Escape, CrowdedOrbitAvoidsTheOtherBody) {
    auto registry = MakeRegistry();
    AddFixed(registry, "EARTH", {0, 0});
    AddCircular(registry, "SAT", {0, 0}, 200.0);
    // A quarter turn ahead on the same orbit. Staying on course reaches it
    // after about 157 of the 300 projected steps.
    AddFixed(registry, "ROCK", {0, 200}, 1.0, 1.0);

    const auto plan = PlanEscape(registry, "SAT", 0.2);

    ASSERT_TRUE(plan.has_value());
    EXPECT_FALSE(std::abs(plan->velocity.x) < 1e-9 && std::abs(plan->velocity.y - 5.0) < 1e-9);

    // Keeping the current velocity runs into the rock.
    const auto stay = PreviewTrajectory(registry, "SAT", {0.0, 5.0}, 0.2);
    double stay_closest = std::numeric_limits<double>::infinity();
    for (const auto& p : stay) stay_closest = std::min(stay_closest, Distance(p, {0, 200}));
    EXPECT_LT(stay_closest, 17.0);

    // The chosen velocity keeps 6 + 1 + 10 clear of it over the whole flight.
    const auto path = PreviewTrajectory(registry, "SAT", plan->velocity, 0.2);
    ASSERT_EQ(path.size(), 301u);
    double closest = std::numeric_limits<double>::infinity();
    for (const auto& p : path) closest = std::min(closest, Distance(p, {0, 200}));
    EXPECT_GE(closest, 17.0);
}

TEST(Escape, PreviewDoesNotTouchTheLiveBody) {
    auto registry = MakeRegistry();
    AddFixed(registry, "EARTH", {0, 0});
    auto sat = AddCircular(registry, "SAT", {0, 0}, 200.0);

    const auto path = PreviewTrajectory(registry, "SAT", {0.0, 6.0}, 0.2, 50);

    ASSERT_EQ(path.size(), 51u);
    EXPECT_EQ(path.front().x, 200.0);
    EXPECT_EQ(path.front().y, 0.0);
    // Faster than circular: the body climbs.
    EXPECT_GT(path.back().Length(), 200.0);

    EXPECT_EQ(registry.get<Position>(sat).p.x, 200.0);
    EXPECT_EQ(registry.get<Velocity>(sat).v.y, 5.0);

    EXPECT_TRUE(PreviewTrajectory(registry, "MISSING", {0, 0}, 0.2).empty());
}
