#pragma once

#include <cmath>

namespace pulsetrace {
namespace geometry {

struct Point {
    float x = 0.0f;
    float y = 0.0f;
};

inline bool operator==(const Point& a, const Point& b) {
    return a.x == b.x && a.y == b.y;
}

inline bool operator!=(const Point& a, const Point& b) {
    return !(a == b);
}

inline float distance(const Point& from, const Point& to) {
    const float dx = to.x - from.x;
    const float dy = to.y - from.y;
    return std::sqrt(dx * dx + dy * dy);
}

inline Point lerp(const Point& from, const Point& to, float t) {
    return Point{from.x + (to.x - from.x) * t,
                 from.y + (to.y - from.y) * t};
}

} // namespace geometry
} // namespace pulsetrace
