#include "kepler.hpp"
#include "components.hpp"
#include "log.hpp"
#include "registry.hpp"

#include <algorithm>
#include <cmath>

namespace orbitwatch {

double SolveKepler(double mean_anomaly, double eccentricity, double tolerance, int max_iterations) {
    double E = mean_anomaly;
    for (int i = 0; i < max_iterations; ++i) {
        const double f = E - eccentricity * std::sin(E) - mean_anomaly;
        const double df = 1.0 - eccentricity * std::cos(E);
        const double dE = f / df;
        E -= dE;
        if (std::abs(dE) < tolerance) {
            break;
        }
    }
    return E;
}

std::optional<KeplerResult> AnalyzeOrbit(const entt::registry& registry, const std::string& body_id) {
    const auto body = FindBody(registry, body_id);
    if (body == entt::null) {
        ORBITWATCH_LOG_DEBUG("Orbit analysis skipped: unknown body " + body_id);
        return std::nullopt;
    }
    if (registry.all_of<Fixed>(body)) {
        return std::nullopt;
    }
    const auto anchor = FindFixedBody(registry);
    if (anchor == entt::null) {
        return std::nullopt;
    }

    const double G = registry.ctx().get<PhysicsSettings>().gravitational_constant;
    const double mu = G * registry.get<Mass>(anchor).m;

    const Vec2 d = registry.get<Position>(body).p - registry.get<Position>(anchor).p;
    const Vec2 v = registry.get<Velocity>(body).v - registry.get<Velocity>(anchor).v;
    const double r = d.Length();
    if (r == 0.0) {
        return std::nullopt;
    }

    KeplerResult result;
    result.specific_energy = v.LengthSquared() / 2.0 - mu / r;
    if (result.specific_energy >= 0.0) {
        return result;
    }

    result.bound = true;
    result.semi_major_axis = -mu / (2.0 * result.specific_energy);

    const double h = d.x * v.y - d.y * v.x;
    const double e_sq = 1.0 + (2.0 * result.specific_energy * h * h) / (mu * mu);
    result.eccentricity = std::sqrt(std::max(0.0, e_sq));

    const double mean_anomaly = std::atan2(d.y, d.x);
    result.eccentric_anomaly = SolveKepler(mean_anomaly, result.eccentricity);
    return result;
}

} // namespace orbitwatch
