#include "comparison.hpp"
#include "components.hpp"
#include "energy.hpp"
#include "integrators.hpp"
#include "registry.hpp"
#include "systems.hpp"

namespace orbitwatch {

ComparisonResult RunComparison(const entt::registry& registry, double dt, int steps, int stride) {
    ComparisonResult result;
    if (CountBodies(registry) < 2 || stride <= 0) {
        return result;
    }

    entt::registry euler = CloneRegistry(registry);
    entt::registry rk4 = CloneRegistry(registry);
    entt::registry verlet = CloneRegistry(registry);

    // Drag is dissipative; the comparison is about integration error only.
    for (auto* sim : {&euler, &rk4, &verlet}) {
        sim->ctx().get<PhysicsSettings>().drag_enabled = false;
    }

    result.initial_energy = TotalEnergy(euler);
    const double e0 = result.initial_energy;

    for (int i = 0; i < steps; ++i) {
        IntegrateEuler(euler, dt, ComputeForces);
        IntegrateRK4(rk4, dt, ComputeForces);
        IntegrateVelocityVerlet(verlet, dt, ComputeForces);

        if (i % stride == 0) {
            result.samples.push_back(DriftSample{
                i,
                EnergyDriftPercent(e0, TotalEnergy(euler)),
                EnergyDriftPercent(e0, TotalEnergy(rk4)),
                EnergyDriftPercent(e0, TotalEnergy(verlet))});
        }
    }
    return result;
}

} // namespace orbitwatch
