#pragma once

#include <variant>
#include <vector>

#include "point.h"

namespace pulsetrace {
namespace geometry {

struct MoveTo {
    Point point;
};

struct LineTo {
    Point point;
};

// Cubic segment. `point` is the end anchor.
struct CurveTo {
    Point point;
    Point control_a;
    Point control_b;
};

struct ClosePath {};

using PathCommand = std::variant<MoveTo, LineTo, CurveTo, ClosePath>;
using Path = std::vector<PathCommand>;

class PathBuilder {
public:
    PathBuilder& move_to(Point point);
    PathBuilder& move_to(float x, float y) { return move_to(Point{x, y}); }
    PathBuilder& line_to(Point point);
    PathBuilder& line_to(float x, float y) { return line_to(Point{x, y}); }
    PathBuilder& curve_to(Point point, Point control_a, Point control_b);
    PathBuilder& close();

    bool empty() const { return commands_.empty(); }
    Path build() const { return commands_; }

private:
    Path commands_;
};

// Where the pen starts: the first MoveTo, or (0,0) when the path never moves.
Point path_origin(const Path& commands);

} // namespace geometry
} // namespace pulsetrace
