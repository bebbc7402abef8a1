#include "registry.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace orbitwatch {

void PrepareRegistry(entt::registry& registry, const PhysicsSettings& settings) {
    if (!registry.ctx().contains<PhysicsSettings>()) {
        registry.ctx().emplace<PhysicsSettings>(settings);
    }
    if (!registry.ctx().contains<SimState>()) {
        registry.ctx().emplace<SimState>();
    }
}

entt::entity CreateBody(entt::registry& registry, const BodySpec& spec) {
    if (spec.id.empty()) {
        throw std::invalid_argument("body id must not be empty");
    }
    if (!(spec.mass > 0.0)) {
        throw std::invalid_argument("body '" + spec.id + "' must have a positive mass");
    }
    if (!(spec.radius > 0.0)) {
        throw std::invalid_argument("body '" + spec.id + "' must have a positive radius");
    }
    if (FindBody(registry, spec.id) != entt::null) {
        throw std::invalid_argument("duplicate body id '" + spec.id + "'");
    }

    PrepareRegistry(registry);
    auto& state = registry.ctx().get<SimState>();

    auto entity = registry.create();
    registry.emplace<Identifier>(entity, spec.id);
    registry.emplace<SpawnOrder>(entity, state.next_sequence++);
    registry.emplace<Position>(entity, spec.position);
    registry.emplace<Velocity>(entity, spec.fixed ? Vec2{} : spec.velocity);
    registry.emplace<Acceleration>(entity, Vec2{});
    registry.emplace<Mass>(entity, spec.mass);
    registry.emplace<Radius>(entity, spec.radius);
    registry.emplace<Trail>(entity);
    if (spec.fixed) {
        registry.emplace<Fixed>(entity);
    }
    return entity;
}

std::vector<entt::entity> OrderedBodies(const entt::registry& registry) {
    auto view = registry.view<const SpawnOrder>();
    std::vector<entt::entity> bodies(view.begin(), view.end());
    std::sort(bodies.begin(), bodies.end(), [&registry](entt::entity lhs, entt::entity rhs) {
        return registry.get<SpawnOrder>(lhs).seq < registry.get<SpawnOrder>(rhs).seq;
    });
    return bodies;
}

entt::entity FindBody(const entt::registry& registry, const std::string& id) {
    auto view = registry.view<const Identifier>();
    for (auto entity : view) {
        if (registry.get<Identifier>(entity).id == id) {
            return entity;
        }
    }
    return entt::null;
}

entt::entity FindFixedBody(const entt::registry& registry) {
    for (auto entity : OrderedBodies(registry)) {
        if (registry.all_of<Fixed>(entity)) {
            return entity;
        }
    }
    return entt::null;
}

std::size_t CountBodies(const entt::registry& registry) {
    auto view = registry.view<const SpawnOrder>();
    return static_cast<std::size_t>(std::distance(view.begin(), view.end()));
}

bool SetBodyVelocity(entt::registry& registry, const std::string& id, const Vec2& velocity) {
    auto entity = FindBody(registry, id);
    if (entity == entt::null || registry.all_of<Fixed>(entity)) {
        return false;
    }
    registry.get<Velocity>(entity).v = velocity;
    registry.get<Trail>(entity).points.clear();
    return true;
}

entt::registry CloneRegistry(const entt::registry& source) {
    entt::registry clone;
    if (const auto* settings = source.ctx().find<PhysicsSettings>()) {
        clone.ctx().emplace<PhysicsSettings>(*settings);
    }
    if (const auto* state = source.ctx().find<SimState>()) {
        clone.ctx().emplace<SimState>(*state);
    }
    PrepareRegistry(clone);

    // Entities are created in spawn order so the clone scans pairs the same way.
    for (auto entity : OrderedBodies(source)) {
        auto copy = clone.create();
        clone.emplace<Identifier>(copy, source.get<Identifier>(entity));
        clone.emplace<SpawnOrder>(copy, source.get<SpawnOrder>(entity));
        clone.emplace<Position>(copy, source.get<Position>(entity));
        clone.emplace<Velocity>(copy, source.get<Velocity>(entity));
        clone.emplace<Acceleration>(copy, source.get<Acceleration>(entity));
        clone.emplace<Mass>(copy, source.get<Mass>(entity));
        clone.emplace<Radius>(copy, source.get<Radius>(entity));
        clone.emplace<Trail>(copy);
        if (source.all_of<Fixed>(entity)) {
            clone.emplace<Fixed>(copy);
        }
    }
    return clone;
}

std::vector<Body> TakeSnapshot(const entt::registry& registry) {
    std::vector<Body> bodies;
    for (auto entity : OrderedBodies(registry)) {
        Body body;
        body.id = registry.get<Identifier>(entity).id;
        body.position = registry.get<Position>(entity).p;
        body.velocity = registry.get<Velocity>(entity).v;
        body.mass = registry.get<Mass>(entity).m;
        body.radius = registry.get<Radius>(entity).r;
        body.fixed = registry.all_of<Fixed>(entity);
        if (const auto* trail = registry.try_get<Trail>(entity)) {
            body.trail.assign(trail->points.begin(), trail->points.end());
        }
        bodies.push_back(std::move(body));
    }
    return bodies;
}

} // namespace orbitwatch
