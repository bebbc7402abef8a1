#ifndef ORBITWATCH_REGISTRY_HPP
#define ORBITWATCH_REGISTRY_HPP

#include <entt/entt.hpp>
#include <string>
#include <vector>

#include "components.hpp"

namespace orbitwatch {

// --- Body Registry ---
// The live body registry is a plain entt::registry. These helpers keep its
// invariants (unique ids, positive mass and radius, spawn order) and provide
// the clone/snapshot API the analyzers use.

/**
 * @brief Everything needed to create one body.
 */
struct BodySpec {
    std::string id;
    Vec2 position;
    Vec2 velocity;
    double mass = 1.0;
    double radius = 1.0;
    bool fixed = false;
};

/**
 * @brief Plain copy of one body, for consumers outside the ECS (renderer, tests).
 */
struct Body {
    std::string id;
    Vec2 position;
    Vec2 velocity;
    double mass = 0.0;
    double radius = 0.0;
    bool fixed = false;
    std::vector<Vec2> trail;
};

/**
 * @brief Installs PhysicsSettings and SimState into the registry context
 * if they are missing. Existing values are left untouched.
 */
void PrepareRegistry(entt::registry& registry, const PhysicsSettings& settings = {});

/**
 * @brief Creates a body. Throws std::invalid_argument on an empty or
 * duplicate id, or on a non-positive mass or radius.
 */
entt::entity CreateBody(entt::registry& registry, const BodySpec& spec);

/**
 * @brief All bodies, in spawn order.
 */
std::vector<entt::entity> OrderedBodies(const entt::registry& registry);

/**
 * @brief Looks a body up by id. Returns entt::null when it does not exist.
 */
entt::entity FindBody(const entt::registry& registry, const std::string& id);

/**
 * @brief First fixed body in spawn order, or entt::null.
 */
entt::entity FindFixedBody(const entt::registry& registry);

std::size_t CountBodies(const entt::registry& registry);

/**
 * @brief Replaces the velocity of a non-fixed body and clears its trail.
 * Returns false for an unknown id or a fixed body.
 */
bool SetBodyVelocity(entt::registry& registry, const std::string& id, const Vec2& velocity);

/**
 * @brief Deep copy of every body and of the registry context.
 * Trails are not carried over.
 */
entt::registry CloneRegistry(const entt::registry& source);

/**
 * @brief Copies the bodies out of the registry, in spawn order.
 */
std::vector<Body> TakeSnapshot(const entt::registry& registry);

} // namespace orbitwatch

#endif // ORBITWATCH_REGISTRY_HPP
