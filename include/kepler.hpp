#ifndef ORBITWATCH_KEPLER_HPP
#define ORBITWATCH_KEPLER_HPP

#include <entt/entt.hpp>
#include <optional>
#include <string>

namespace orbitwatch {

/**
 * @brief Keplerian elements of one body relative to the fixed body.
 *
 * When `bound` is false the trajectory is hyperbolic or parabolic: only
 * `specific_energy` is meaningful and `eccentricity` holds the lower bound 1.
 */
struct KeplerResult {
    bool bound = false;
    double eccentricity = 1.0;
    double semi_major_axis = 0.0;
    double eccentric_anomaly = 0.0; // radians
    double specific_energy = 0.0;
};

/**
 * @brief Newton-Raphson on E - e*sin(E) - M = 0, starting at E = M.
 * Stops after `max_iterations` or once |dE| < `tolerance`.
 */
double SolveKepler(double mean_anomaly, double eccentricity,
                   double tolerance = 1e-6, int max_iterations = 10);

/**
 * @brief Orbit of `body_id` around the first fixed body.
 *
 * Returns std::nullopt for an unknown or fixed body, when there is no fixed
 * body, or when the two coincide.
 *
 * The mean anomaly fed to SolveKepler() is the polar angle atan2(dy, dx),
 * not a true-to-mean anomaly conversion.
 */
std::optional<KeplerResult> AnalyzeOrbit(const entt::registry& registry, const std::string& body_id);

} // namespace orbitwatch

#endif // ORBITWATCH_KEPLER_HPP
