#include "collision.hpp"
#include "registry.hpp"

#include <cstdio>
#include <set>

namespace orbitwatch {

const char* ToString(CollisionKind kind) {
    switch (kind) {
        case CollisionKind::Impact: return "impact";
        case CollisionKind::Mutual: return "mutual";
    }
    return "unknown";
}

namespace {
    std::string FormatVelocity(const Vec2& v) {
        char buffer[64];
        std::snprintf(buffer, sizeof(buffer), "(vx:%.2f, vy:%.2f)", v.x, v.y);
        return buffer;
    }
} // namespace

std::string Describe(const CollisionEvent& event) {
    const char* arrow = event.kind == CollisionKind::Impact ? " -> " : " <-> ";
    std::string text = "COLLISION: " + event.first_id + " " + FormatVelocity(event.first_velocity) + arrow + event.second_id;
    if (event.kind == CollisionKind::Mutual) {
        text += " " + FormatVelocity(event.second_velocity);
    }
    return text;
}

std::vector<CollisionEvent> ResolveCollisions(entt::registry& registry) {
    const auto bodies = OrderedBodies(registry);
    std::set<entt::entity> marked;
    std::vector<CollisionEvent> events;

    for (std::size_t i = 0; i < bodies.size(); ++i) {
        for (std::size_t j = i + 1; j < bodies.size(); ++j) {
            const auto b1 = bodies[i];
            const auto b2 = bodies[j];
            if (marked.count(b1) || marked.count(b2)) continue;

            double dist = Distance(registry.get<Position>(b1).p, registry.get<Position>(b2).p);
            double min_dist = registry.get<Radius>(b1).r + registry.get<Radius>(b2).r;
            if (dist >= min_dist) continue;

            const bool fixed1 = registry.all_of<Fixed>(b1);
            const bool fixed2 = registry.all_of<Fixed>(b2);

            if (fixed1 && fixed2) {
                // Two anchors overlapping is a scenario property, not a collision.
                continue;
            }

            CollisionEvent event;
            if (fixed1 || fixed2) {
                const auto satellite = fixed1 ? b2 : b1;
                const auto anchor = fixed1 ? b1 : b2;
                marked.insert(satellite);

                event.kind = CollisionKind::Impact;
                event.first_id = registry.get<Identifier>(satellite).id;
                event.second_id = registry.get<Identifier>(anchor).id;
                event.first_velocity = registry.get<Velocity>(satellite).v;
                event.second_velocity = registry.get<Velocity>(anchor).v;
            } else {
                marked.insert(b1);
                marked.insert(b2);

                event.kind = CollisionKind::Mutual;
                event.first_id = registry.get<Identifier>(b1).id;
                event.second_id = registry.get<Identifier>(b2).id;
                event.first_velocity = registry.get<Velocity>(b1).v;
                event.second_velocity = registry.get<Velocity>(b2).v;
            }
            events.push_back(std::move(event));
        }
    }

    for (auto entity : marked) {
        registry.destroy(entity);
    }
    return events;
}

} // namespace orbitwatch
