#include "vp/vec2.h"

namespace vp {

Vec2 Vec2::unit() const {
    double n = norm();
    if (n < 1e-6) return {0.0, 0.0};
    return {x / n, y / n};
}

Vec2 attackingGoalCenter(const Pitch& pitch, int attackDirection) {
    double x = attackDirection > 0 ? pitch.length : 0.0;
    return {x, pitch.width * 0.5};
}

bool isAhead(Vec2 a, Vec2 b, int attackDirection) {
    return (a.x - b.x) * attackDirection > 0.0;
}

bool inForwardCone(Vec2 origin, Vec2 target, int attackDirection, double cosThreshold) {
    Vec2 forward{static_cast<double>(attackDirection), 0.0};
    // A zero offset gives a zero unit vector, so dot = 0
    return (target - origin).unit().dot(forward) >= cosThreshold;
}

} // namespace vp
