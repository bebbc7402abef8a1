#ifndef ORBITWATCH_TEST_HELPERS_HPP
#define ORBITWATCH_TEST_HELPERS_HPP

#include <entt/entt.hpp>
#include <cmath>
#include <string>

#include "components.hpp"
#include "registry.hpp"

namespace orbitwatch::test {

inline entt::entity AddFixed(entt::registry& registry, const std::string& id, Vec2 position,
                             double mass = 10000.0, double radius = 30.0) {
    BodySpec spec;
    spec.id = id;
    spec.position = position;
    spec.mass = mass;
    spec.radius = radius;
    spec.fixed = true;
    return CreateBody(registry, spec);
}

inline entt::entity AddMover(entt::registry& registry, const std::string& id, Vec2 position, Vec2 velocity,
                             double mass = 5.0, double radius = 6.0) {
    BodySpec spec;
    spec.id = id;
    spec.position = position;
    spec.velocity = velocity;
    spec.mass = mass;
    spec.radius = radius;
    return CreateBody(registry, spec);
}

// Satellite on a circular orbit of radius r around `anchor_pos`, starting on the +x side.
inline entt::entity AddCircular(entt::registry& registry, const std::string& id, Vec2 anchor_pos,
                                double r, double central_mass = 10000.0) {
    const double G = registry.ctx().get<PhysicsSettings>().gravitational_constant;
    const double v = std::sqrt(G * central_mass / r);
    return AddMover(registry, id, anchor_pos + Vec2{r, 0.0}, {0.0, v});
}

inline entt::registry MakeRegistry(bool drag = false) {
    entt::registry registry;
    PhysicsSettings settings;
    settings.drag_enabled = drag;
    PrepareRegistry(registry, settings);
    return registry;
}

} // namespace orbitwatch::test

#endif // ORBITWATCH_TEST_HELPERS_HPP
