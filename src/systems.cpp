#include "systems.hpp"
#include "components.hpp"
#include "log.hpp"
#include "registry.hpp"

#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace orbitwatch {

// --- Force Systems ---

namespace {
    // A registry that never went through PrepareRegistry() runs with the defaults.
    PhysicsSettings SettingsOf(const entt::registry& registry) {
        const auto* settings = registry.ctx().find<PhysicsSettings>();
        return settings ? *settings : PhysicsSettings{};
    }
} // namespace

void ClearAccelerationSystem(entt::registry& registry) {
    auto view = registry.view<Acceleration>();
    for (auto entity : view) {
        auto& acc = view.get<Acceleration>(entity);
        acc.a = {0.0, 0.0};
    }
}

void GravitySystem(entt::registry& registry) {
    const PhysicsSettings settings = SettingsOf(registry);

    // Sources are summed in spawn order so every run adds them up the same way.
    const auto bodies = OrderedBodies(registry);

    for (auto entity_i : bodies) {
        if (registry.all_of<Fixed>(entity_i)) continue;

        const auto& pos_i = registry.get<Position>(entity_i);
        auto& acc_i = registry.get<Acceleration>(entity_i);

        for (auto entity_j : bodies) {
            if (entity_i == entity_j) continue; // Don't interact with self

            const auto& pos_j = registry.get<Position>(entity_j);
            const auto& mass_j = registry.get<Mass>(entity_j);

            // Calculate vector from i to j
            Vec2 r_vec = pos_j.p - pos_i.p;
            double r_sq = r_vec.LengthSquared();

            // Coincident bodies have no direction to pull along.
            if (r_sq == 0.0) continue;

            // Softening only enters the square root
            double r = std::sqrt(r_sq + settings.softening);
            double f = settings.gravitational_constant * mass_j.m / (r_sq * r);

            // *Accumulate* (add to) acceleration on 'i'
            acc_i.a += r_vec * f;
        }
    }
}

void AtmosphericDragSystem(entt::registry& registry) {
    const PhysicsSettings settings = SettingsOf(registry);
    if (!settings.drag_enabled) return;

    auto movers = registry.view<Position, Velocity, Acceleration>(entt::exclude<Fixed>);
    auto anchors = registry.view<Position, Fixed>();

    for (auto entity_i : movers) {
        const auto& pos_i = movers.get<Position>(entity_i);
        const auto& vel_i = movers.get<Velocity>(entity_i);
        auto& acc_i = movers.get<Acceleration>(entity_i);
        const double speed = vel_i.v.Length();

        for (auto entity_j : anchors) {
            const auto& pos_j = registry.get<Position>(entity_j);
            double dist = std::sqrt((pos_j.p - pos_i.p).LengthSquared() + settings.softening);
            if (dist < settings.atmosphere_radius) {
                acc_i.a -= vel_i.v * (settings.drag_coefficient * speed);
            }
        }
    }
}

std::vector<ForceSystemFn> DefaultForceSystems() {
    return {ClearAccelerationSystem, GravitySystem, AtmosphericDragSystem};
}

void ComputeForces(entt::registry& registry) {
    ClearAccelerationSystem(registry);
    GravitySystem(registry);
    AtmosphericDragSystem(registry);
}


// --- Other Systems ---

void UpdateTrailSystem(entt::registry& registry, std::size_t capacity) {
    auto view = registry.view<Position, Trail>(entt::exclude<Fixed>);
    for (auto entity : view) {
        const auto& pos = view.get<Position>(entity);
        auto& trail = view.get<Trail>(entity);
        trail.points.push_back(pos.p);
        while (trail.points.size() > capacity) {
            trail.points.pop_front();
        }
    }
}


// --- File I/O Systems ---

bool loadScenarioFromFile(entt::registry& registry, const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        ORBITWATCH_LOG_ERROR("Could not open scenario file: " + filename);
        return false;
    }

    ORBITWATCH_LOG_INFO("Loading bodies from " + filename + "...");
    std::string line;
    int count = 0;
    while (std::getline(file, line)) {
        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        std::stringstream ss(line);
        BodySpec spec;
        int fixed = 0;

        if (ss >> spec.id >> spec.position.x >> spec.position.y
               >> spec.velocity.x >> spec.velocity.y >> spec.mass >> spec.radius >> fixed) {
            spec.fixed = fixed != 0;
            try {
                CreateBody(registry, spec);
            } catch (const std::invalid_argument& e) {
                ORBITWATCH_LOG_WARN(std::string("Skipping invalid body: ") + e.what());
                continue;
            }
            ORBITWATCH_LOG_DEBUG("  Loaded: " + spec.id);
            count++;
        } else {
            ORBITWATCH_LOG_WARN("Skipping malformed line: " + line);
        }
    }
    ORBITWATCH_LOG_INFO("Loaded " + std::to_string(count) + " bodies.");
    return true;
}

} // namespace orbitwatch
