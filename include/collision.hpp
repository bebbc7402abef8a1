#ifndef ORBITWATCH_COLLISION_HPP
#define ORBITWATCH_COLLISION_HPP

#include <entt/entt.hpp>
#include <string>
#include <vector>

#include "components.hpp"

namespace orbitwatch {

enum class CollisionKind {
    Impact, // a body hit a fixed body; only the mover is destroyed
    Mutual  // two movers destroyed each other
};

const char* ToString(CollisionKind kind);

/**
 * @brief One collision found by ResolveCollisions().
 * For an Impact, `first` is the destroyed body and `second` the fixed one.
 */
struct CollisionEvent {
    CollisionKind kind = CollisionKind::Mutual;
    std::string first_id;
    std::string second_id;
    Vec2 first_velocity;
    Vec2 second_velocity;
};

std::string Describe(const CollisionEvent& event);

/**
 * @brief Finds overlapping pairs and destroys the bodies involved.
 *
 * Pairs are scanned in spawn order; a body that is already marked takes no
 * further part in the scan. Destruction happens in one pass once the scan
 * is complete.
 */
std::vector<CollisionEvent> ResolveCollisions(entt::registry& registry);

} // namespace orbitwatch

#endif // ORBITWATCH_COLLISION_HPP
