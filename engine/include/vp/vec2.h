#pragma once

#include <cmath>

namespace vp {

// Pitch coordinates: x runs along the length, y across the width.
struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    Vec2 operator+(Vec2 o) const { return {x + o.x, y + o.y}; }
    Vec2 operator-(Vec2 o) const { return {x - o.x, y - o.y}; }
    Vec2 operator*(double s) const { return {x * s, y * s}; }

    double dot(Vec2 o) const { return x * o.x + y * o.y; }
    double norm() const { return std::sqrt(x * x + y * y); }

    // Euclidean distance
    double distanceTo(Vec2 other) const { return (*this - other).norm(); }

    // Unit vector, or (0,0) for a near-zero vector
    Vec2 unit() const;

    bool operator==(Vec2 o) const { return x == o.x && y == o.y; }
    bool operator!=(Vec2 o) const { return !(*this == o); }
};

struct Pitch {
    double length = 105.0;
    double width = 68.0;
};

// Center of the goal line being attacked.
// attackDirection +1: goal at x = length, -1: goal at x = 0
Vec2 attackingGoalCenter(const Pitch& pitch, int attackDirection);

// True if a is strictly further than b along the attack direction
bool isAhead(Vec2 a, Vec2 b, int attackDirection);

// True if target lies within the forward cone of origin.
// cosThreshold 1.0 = exactly forward, 0.0 = forward half-plane
bool inForwardCone(Vec2 origin, Vec2 target, int attackDirection, double cosThreshold);

} // namespace vp
