#ifndef ORBITWATCH_SYSTEMS_HPP
#define ORBITWATCH_SYSTEMS_HPP

#include <entt/entt.hpp>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace orbitwatch {

// --- System Declarations ---
// Systems are free functions that operate on entities.

// A function that calculates all forces and updates accelerations in the registry.
using ForceSystemFn = std::function<void(entt::registry&)>;

// --- Force Systems ---
// These systems *add* to the Acceleration component. Fixed bodies are
// never targets; they only act as sources.

/**
 * @brief Resets all accelerations to zero.
 * MUST be run first in the force pipeline.
 */
void ClearAccelerationSystem(entt::registry& registry);

/**
 * @brief Softened pairwise gravity.
 * Reads Position and Mass, and *adds* G*m_j*d / (|d|^2 * sqrt(|d|^2 + softening))
 * to the Acceleration of every non-fixed body.
 */
void GravitySystem(entt::registry& registry);

/**
 * @brief Velocity-proportional drag inside the atmosphere of each fixed body.
 * No-op unless PhysicsSettings::drag_enabled is set in the registry context.
 */
void AtmosphericDragSystem(entt::registry& registry);

/**
 * @brief The standard force pipeline: clear, gravity, drag.
 */
std::vector<ForceSystemFn> DefaultForceSystems();

/**
 * @brief Runs DefaultForceSystems() against the registry.
 */
void ComputeForces(entt::registry& registry);


// --- Other Systems ---

/**
 * @brief Appends the current position to the Trail of every non-fixed body,
 * dropping the oldest point beyond `capacity`.
 */
void UpdateTrailSystem(entt::registry& registry, std::size_t capacity);


// --- File I/O Systems ---

/**
 * @brief Loads bodies from a text file, one per line:
 * `id x y vx vy mass radius fixed`. Lines starting with '#' are comments.
 */
bool loadScenarioFromFile(entt::registry& registry, const std::string& filename);

} // namespace orbitwatch

#endif // ORBITWATCH_SYSTEMS_HPP
