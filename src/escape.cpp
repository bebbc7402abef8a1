#include "escape.hpp"
#include "integrators.hpp"
#include "log.hpp"
#include "registry.hpp"
#include "systems.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>

namespace orbitwatch {

namespace {
    constexpr std::array<double, 7> kSpeedFactors = {0.85, 0.9, 0.95, 1.0, 1.05, 1.1, 1.15};
    constexpr std::array<double, 7> kHeadingOffsets = {0.0, 0.1, -0.1, 0.2, -0.2, 0.3, -0.3};
} // namespace

std::vector<Vec2> EscapeCandidates(const Vec2& velocity, double escape_velocity, double max_escape_fraction) {
    const double speed = velocity.Length();
    const double heading = std::atan2(velocity.y, velocity.x);

    std::vector<Vec2> candidates;
    for (double factor : kSpeedFactors) {
        const double new_speed = speed * factor;
        if (new_speed > escape_velocity * max_escape_fraction) continue;
        for (double offset : kHeadingOffsets) {
            const double new_heading = heading + offset;
            candidates.push_back({std::cos(new_heading) * new_speed, std::sin(new_heading) * new_speed});
        }
    }
    return candidates;
}

std::optional<ManeuverCandidate> PlanEscape(const entt::registry& registry, const std::string& body_id,
                                            double dt, const EscapeSettings& settings) {
    const auto body = FindBody(registry, body_id);
    if (body == entt::null || registry.all_of<Fixed>(body)) {
        ORBITWATCH_LOG_DEBUG("Escape planning skipped: no movable body " + body_id);
        return std::nullopt;
    }
    const auto anchor = FindFixedBody(registry);
    if (anchor == entt::null) {
        ORBITWATCH_LOG_DEBUG("Escape planning skipped: no fixed body");
        return std::nullopt;
    }

    const double G = registry.ctx().get<PhysicsSettings>().gravitational_constant;
    const Vec2 anchor_pos = registry.get<Position>(anchor).p;
    const double r = Distance(registry.get<Position>(body).p, anchor_pos);
    if (r == 0.0) {
        return std::nullopt;
    }
    const double escape_velocity = std::sqrt(2.0 * G * registry.get<Mass>(anchor).m / r);

    std::optional<ManeuverCandidate> best;

    for (const Vec2& candidate : EscapeCandidates(registry.get<Velocity>(body).v, escape_velocity,
                                                  settings.max_escape_fraction)) {
        entt::registry ghost = CloneRegistry(registry);
        const auto self = FindBody(ghost, body_id);
        ghost.get<Velocity>(self).v = candidate;

        const double self_radius = ghost.get<Radius>(self).r;
        const auto others = OrderedBodies(ghost);

        double min_distance = std::numeric_limits<double>::infinity();
        double max_deviation = 0.0;
        bool collided = false;

        for (int step = 0; step < settings.steps && !collided; ++step) {
            IntegrateRK4(ghost, dt * 2.0, ComputeForces);
            const Vec2 self_pos = ghost.get<Position>(self).p;

            for (auto other : others) {
                if (other == self) continue;
                const double d = Distance(self_pos, ghost.get<Position>(other).p);
                min_distance = std::min(min_distance, d);
                if (d < self_radius + ghost.get<Radius>(other).r + settings.collision_margin) {
                    collided = true;
                }
            }
            if (collided) break;

            max_deviation = std::max(max_deviation, std::abs(Distance(self_pos, anchor_pos) - r));
        }

        if (collided) continue;

        const double score = settings.distance_weight * min_distance - settings.deviation_weight * max_deviation;
        if (!best || score > best->score) {
            best = ManeuverCandidate{candidate, score};
        }
    }

    return best;
}

std::vector<Vec2> PreviewTrajectory(const entt::registry& registry, const std::string& body_id,
                                    const Vec2& velocity, double dt, int steps) {
    std::vector<Vec2> path;
    entt::registry ghost = CloneRegistry(registry);
    const auto self = FindBody(ghost, body_id);
    if (self == entt::null) {
        return path;
    }
    if (!ghost.all_of<Fixed>(self)) {
        ghost.get<Velocity>(self).v = velocity;
    }

    path.reserve(static_cast<std::size_t>(steps) + 1);
    path.push_back(ghost.get<Position>(self).p);
    for (int step = 0; step < steps; ++step) {
        IntegrateRK4(ghost, dt * 2.0, ComputeForces);
        path.push_back(ghost.get<Position>(self).p);
    }
    return path;
}

} // namespace orbitwatch
