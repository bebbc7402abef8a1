#ifndef ORBITWATCH_COMPARISON_HPP
#define ORBITWATCH_COMPARISON_HPP

#include <entt/entt.hpp>
#include <vector>

namespace orbitwatch {

/**
 * @brief Energy drift (percent) of each integrator after `step` + 1 steps.
 */
struct DriftSample {
    int step = 0;
    double euler = 0.0;
    double rk4 = 0.0;
    double verlet = 0.0;
};

struct ComparisonResult {
    double initial_energy = 0.0;
    std::vector<DriftSample> samples;
};

/**
 * @brief Runs Euler, RK4 and Verlet side by side on three clones of
 * `registry` for `steps` steps of `dt`, with drag switched off, and keeps
 * every `stride`-th drift sample. Returns an empty series for fewer than
 * two bodies.
 */
ComparisonResult RunComparison(const entt::registry& registry, double dt, int steps = 300, int stride = 5);

} // namespace orbitwatch

#endif // ORBITWATCH_COMPARISON_HPP
