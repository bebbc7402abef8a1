#ifndef ORBITWATCH_INTEGRATORS_HPP
#define ORBITWATCH_INTEGRATORS_HPP

#include <entt/entt.hpp>
#include <functional>
#include <string>

namespace orbitwatch {

// The "Force Pipeline": recomputes every Acceleration in the registry.
using ForcePipelineFn = std::function<void(entt::registry&)>;

// A function that performs one complete integration step.
// It takes the physics 'dt' and the force pipeline to use.
using IntegratorStepFn = std::function<void(entt::registry&, double, const ForcePipelineFn&)>;

enum class IntegratorKind {
    Euler,
    Verlet,
    RK4
};

const char* ToString(IntegratorKind kind);

/**
 * @brief Maps "euler", "verlet" or "rk4" (any case) to a kind.
 * Unknown names fall back to Verlet with a warning.
 */
IntegratorKind ParseIntegratorKind(const std::string& name);


// --- Integrator Implementations ---
// All integrators move non-fixed bodies only.

/**
 * @brief Integrator: semi-implicit Euler
 * - a(t) from the force pipeline
 * - v(t + dt) = v(t) + a(t) * dt
 * - x(t + dt) = x(t) + v(t + dt) * dt
 */
void IntegrateEuler(entt::registry& registry, double dt, const ForcePipelineFn& calculate_forces);

/**
 * @brief Classic four-stage Runge-Kutta. Runs the force pipeline four
 * times per step; positions and velocities of the stages are written into
 * the registry while the pipeline runs.
 */
void IntegrateRK4(entt::registry& registry, double dt, const ForcePipelineFn& calculate_forces);

/**
 * @brief First half of a velocity Verlet step, using the stored a(t):
 * half kick v += a * dt/2, then drift x += v * dt.
 */
void IntegrateVelocityVerlet_Part1(entt::registry& registry, double dt);

/**
 * @brief Second half kick, v += a * dt/2. Run the force pipeline first so
 * Acceleration holds a(t + dt).
 */
void IntegrateVelocityVerlet_Part2(entt::registry& registry, double dt);

/**
 * @brief Full velocity Verlet step: forces, part 1, forces, part 2.
 */
void IntegrateVelocityVerlet(entt::registry& registry, double dt, const ForcePipelineFn& calculate_forces);

/**
 * @brief The step function for a kind.
 */
IntegratorStepFn GetIntegrator(IntegratorKind kind);

/**
 * @brief One step of `kind` using the standard force pipeline (ComputeForces).
 */
void Step(entt::registry& registry, IntegratorKind kind, double dt);

} // namespace orbitwatch

#endif // ORBITWATCH_INTEGRATORS_HPP
