#ifndef ORBITWATCH_ESCAPE_HPP
#define ORBITWATCH_ESCAPE_HPP

#include <entt/entt.hpp>
#include <optional>
#include <string>
#include <vector>

#include "components.hpp"

namespace orbitwatch {

struct ManeuverCandidate {
    Vec2 velocity;
    double score = 0.0;
};

struct EscapeSettings {
    int steps = 300;
    // Added to the sum of radii when checking for a collision.
    double collision_margin = 10.0;
    // Candidates faster than this fraction of escape velocity are dropped.
    double max_escape_fraction = 0.9;
    double distance_weight = 2.0;
    double deviation_weight = 0.8;
};

/**
 * @brief The velocity grid searched by PlanEscape(): speed factors
 * 0.85..1.15 crossed with heading offsets 0, +-0.1, +-0.2, +-0.3 rad,
 * minus anything faster than max_escape_fraction * v_esc.
 */
std::vector<Vec2> EscapeCandidates(const Vec2& velocity, double escape_velocity,
                                   double max_escape_fraction = 0.9);

/**
 * @brief Searches for a safer velocity for `body_id`.
 *
 * Every candidate is flown on its own clone with RK4 at 2*dt. A candidate
 * that comes within (r_i + r_j + collision_margin) of any other body is
 * disqualified; the others score
 * distance_weight * min_distance - deviation_weight * max_radius_deviation.
 *
 * Returns the best candidate, or std::nullopt when none survives or the
 * body cannot be planned for (unknown, fixed, no fixed body). The
 * registry is never modified.
 */
std::optional<ManeuverCandidate> PlanEscape(const entt::registry& registry, const std::string& body_id,
                                            double dt, const EscapeSettings& settings = {});

/**
 * @brief Positions visited by `body_id` when flown with `velocity` for
 * `steps` RK4 steps of 2*dt on a clone. Empty for an unknown body.
 */
std::vector<Vec2> PreviewTrajectory(const entt::registry& registry, const std::string& body_id,
                                    const Vec2& velocity, double dt, int steps = 300);

} // namespace orbitwatch

#endif // ORBITWATCH_ESCAPE_HPP
