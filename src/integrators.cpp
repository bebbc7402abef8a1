#include "integrators.hpp"
#include "components.hpp"
#include "log.hpp"
#include "systems.hpp"

#include <algorithm>
#include <cctype>
#include <map>

namespace orbitwatch {

const char* ToString(IntegratorKind kind) {
    switch (kind) {
        case IntegratorKind::Euler:  return "euler";
        case IntegratorKind::Verlet: return "verlet";
        case IntegratorKind::RK4:    return "rk4";
    }
    return "unknown";
}

IntegratorKind ParseIntegratorKind(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "euler") return IntegratorKind::Euler;
    if (lowered == "verlet") return IntegratorKind::Verlet;
    if (lowered == "rk4") return IntegratorKind::RK4;

    ORBITWATCH_LOG_WARN("Integrator '" + name + "' not found. Defaulting to verlet.");
    return IntegratorKind::Verlet;
}


// --- Euler Implementation ---

void IntegrateEuler(entt::registry& registry, double dt, const ForcePipelineFn& calculate_forces) {
    calculate_forces(registry);

    // Semi-implicit: the position update uses the new velocity.
    auto view = registry.view<Position, Velocity, Acceleration>(entt::exclude<Fixed>);
    view.each([dt](Position& pos, Velocity& vel, const Acceleration& acc) {
        vel.v += acc.a * dt;
        pos.p += vel.v * dt;
    });
}


// --- RK4 Implementation ---

namespace {
    // Per-body RK4 bookkeeping: the state at t and the four stage derivatives.
    struct Rk4Stages {
        Vec2 x0, v0;
        Vec2 dx[4], dv[4];
    };

    // Stage k is evaluated at t + kStageOffset[k] * dt, from the derivative of stage k - 1.
    constexpr double kStageOffset[4] = {0.0, 0.5, 0.5, 1.0};
} // namespace

void IntegrateRK4(entt::registry& registry, double dt, const ForcePipelineFn& calculate_forces) {
    auto view = registry.view<Position, Velocity, Acceleration>(entt::exclude<Fixed>);

    std::map<entt::entity, Rk4Stages> stages;
    for (auto entity : view) {
        auto& s = stages[entity];
        s.x0 = view.get<Position>(entity).p;
        s.v0 = view.get<Velocity>(entity).v;
    }

    for (int k = 0; k < 4; ++k) {
        if (k > 0) {
            const double h = kStageOffset[k] * dt;
            for (auto entity : view) {
                const auto& s = stages[entity];
                view.get<Position>(entity).p = s.x0 + s.dx[k - 1] * h;
                view.get<Velocity>(entity).v = s.v0 + s.dv[k - 1] * h;
            }
        }

        calculate_forces(registry);
        for (auto entity : view) {
            auto& s = stages[entity];
            s.dx[k] = view.get<Velocity>(entity).v;
            s.dv[k] = view.get<Acceleration>(entity).a;
        }
    }

    // y(t + dt) = y(t) + (k1 + 2*k2 + 2*k3 + k4) * dt / 6
    for (auto entity : view) {
        const auto& s = stages[entity];
        view.get<Position>(entity).p = s.x0 + (s.dx[0] + 2.0 * s.dx[1] + 2.0 * s.dx[2] + s.dx[3]) * (dt / 6.0);
        view.get<Velocity>(entity).v = s.v0 + (s.dv[0] + 2.0 * s.dv[1] + 2.0 * s.dv[2] + s.dv[3]) * (dt / 6.0);
    }
}


// --- Velocity Verlet Implementation ---

void IntegrateVelocityVerlet_Part1(entt::registry& registry, double dt) {
    const double half_dt = dt / 2.0;
    auto view = registry.view<Position, Velocity, Acceleration>(entt::exclude<Fixed>);
    view.each([half_dt, dt](Position& pos, Velocity& vel, const Acceleration& acc) {
        vel.v += acc.a * half_dt; // kick to t + dt/2
        pos.p += vel.v * dt;      // drift to t + dt
    });
}

void IntegrateVelocityVerlet_Part2(entt::registry& registry, double dt) {
    const double half_dt = dt / 2.0;
    // Acceleration now holds a(t + dt)
    auto view = registry.view<Velocity, Acceleration>(entt::exclude<Fixed>);
    view.each([half_dt](Velocity& vel, const Acceleration& acc) {
        vel.v += acc.a * half_dt;
    });
}

void IntegrateVelocityVerlet(entt::registry& registry, double dt, const ForcePipelineFn& calculate_forces) {
    // a(t) is recomputed rather than reused: collisions and velocity edits
    // between ticks leave the stored acceleration stale.
    calculate_forces(registry);
    IntegrateVelocityVerlet_Part1(registry, dt);
    calculate_forces(registry);
    IntegrateVelocityVerlet_Part2(registry, dt);
}


IntegratorStepFn GetIntegrator(IntegratorKind kind) {
    switch (kind) {
        case IntegratorKind::Euler:  return IntegrateEuler;
        case IntegratorKind::RK4:    return IntegrateRK4;
        case IntegratorKind::Verlet: return IntegrateVelocityVerlet;
    }
    return IntegrateVelocityVerlet;
}

void Step(entt::registry& registry, IntegratorKind kind, double dt) {
    GetIntegrator(kind)(registry, dt, ComputeForces);
}

} // namespace orbitwatch
