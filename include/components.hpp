#ifndef ORBITWATCH_COMPONENTS_HPP
#define ORBITWATCH_COMPONENTS_HPP

#include <cmath>
#include <cstdint>
#include <deque>
#include <string>

namespace orbitwatch {

// --- Helper: 2D Vector ---
struct Vec2 {
    double x = 0.0, y = 0.0;

    Vec2& operator+=(const Vec2& rhs) {
        x += rhs.x; y += rhs.y;
        return *this;
    }
    Vec2& operator-=(const Vec2& rhs) {
        x -= rhs.x; y -= rhs.y;
        return *this;
    }
    Vec2& operator*=(double scalar) {
        x *= scalar; y *= scalar;
        return *this;
    }
    Vec2& operator/=(double scalar) {
        x /= scalar; y /= scalar;
        return *this;
    }

    double LengthSquared() const { return x * x + y * y; }
    double Length() const { return std::sqrt(LengthSquared()); }
};

// Non-member operators
inline Vec2 operator+(Vec2 lhs, const Vec2& rhs) { return lhs += rhs; }
inline Vec2 operator-(Vec2 lhs, const Vec2& rhs) { return lhs -= rhs; }
inline Vec2 operator*(Vec2 lhs, double scalar) { return lhs *= scalar; }
inline Vec2 operator*(double scalar, Vec2 rhs) { return rhs *= scalar; }
inline Vec2 operator/(Vec2 lhs, double scalar) { return lhs /= scalar; }

inline double Distance(const Vec2& a, const Vec2& b) { return (a - b).Length(); }


// --- Components ---
// Components are simple data-only structs.

struct Identifier { std::string id; };
struct Position { Vec2 p; };
struct Velocity { Vec2 v; };
struct Acceleration { Vec2 a; };
struct Mass { double m; };
struct Radius { double r; };

// Creation order. Every pairwise scan walks bodies in this order.
struct SpawnOrder { std::uint64_t seq; };

// Tag: immovable body with infinite effective mass (the central mass).
struct Fixed {};

// Recent positions for the renderer. Not part of the physics.
struct Trail {
    std::deque<Vec2> points;
};


// --- Global Simulation State ---
// Stored in the registry's "context" via registry.ctx(), so that a cloned
// registry carries the same physics as the one it was copied from.

struct PhysicsSettings {
    double gravitational_constant = 0.5;
    // Added under the square root of the separation (units^2).
    double softening = 2.0;
    double atmosphere_radius = 250.0;
    double drag_coefficient = 0.02;
    bool drag_enabled = false;
};

struct SimState {
    double current_time = 0.0;
    std::uint64_t tick_count = 0;
    std::uint64_t next_sequence = 0;
};

} // namespace orbitwatch

#endif // ORBITWATCH_COMPONENTS_HPP
