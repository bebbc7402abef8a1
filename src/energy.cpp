#include "energy.hpp"
#include "components.hpp"
#include "registry.hpp"

#include <algorithm>
#include <cmath>

namespace orbitwatch {

double TotalEnergy(const entt::registry& registry) {
    const auto* settings = registry.ctx().find<PhysicsSettings>();
    const double G = settings ? settings->gravitational_constant : PhysicsSettings{}.gravitational_constant;
    const auto bodies = OrderedBodies(registry);

    double kinetic = 0.0;
    double potential = 0.0;
    for (std::size_t i = 0; i < bodies.size(); ++i) {
        const auto& mass_i = registry.get<Mass>(bodies[i]);
        const auto& pos_i = registry.get<Position>(bodies[i]);
        kinetic += 0.5 * mass_i.m * registry.get<Velocity>(bodies[i]).v.LengthSquared();

        for (std::size_t j = i + 1; j < bodies.size(); ++j) {
            double r = Distance(registry.get<Position>(bodies[j]).p, pos_i.p);
            if (r > 0.0) {
                potential -= G * mass_i.m * registry.get<Mass>(bodies[j]).m / r;
            }
        }
    }
    return kinetic + potential;
}

double EnergyDriftPercent(double initial_energy, double energy) {
    if (initial_energy == 0.0) {
        return 0.0;
    }
    return std::abs((energy - initial_energy) / initial_energy) * 100.0;
}

const char* ToString(EnergyStatus status) {
    switch (status) {
        case EnergyStatus::Stable:   return "stable";
        case EnergyStatus::Unstable: return "unstable";
        case EnergyStatus::Critical: return "critical";
    }
    return "unknown";
}

void EnergyMonitor::Record(double energy) {
    if (!m_initial) {
        m_initial = energy;
    }
    m_samples.push_back(energy);
    while (m_samples.size() > m_capacity) {
        m_samples.pop_front();
    }
}

void EnergyMonitor::Reset() {
    m_samples.clear();
    m_initial.reset();
}

double EnergyMonitor::DriftPercent() const {
    if (!m_initial || m_samples.empty()) {
        return 0.0;
    }
    return EnergyDriftPercent(*m_initial, m_samples.back());
}

double EnergyMonitor::AccuracyScore() const {
    return std::max(0.0, 100.0 - DriftPercent() * 10.0);
}

EnergyStatus EnergyMonitor::Status() const {
    const double score = AccuracyScore();
    if (score < 50.0) return EnergyStatus::Critical;
    if (score < 85.0) return EnergyStatus::Unstable;
    return EnergyStatus::Stable;
}

} // namespace orbitwatch
