#include "path.h"

namespace pulsetrace {
namespace geometry {

PathBuilder& PathBuilder::move_to(Point point) {
    commands_.emplace_back(MoveTo{point});
    return *this;
}

PathBuilder& PathBuilder::line_to(Point point) {
    commands_.emplace_back(LineTo{point});
    return *this;
}

PathBuilder& PathBuilder::curve_to(Point point, Point control_a, Point control_b) {
    commands_.emplace_back(CurveTo{point, control_a, control_b});
    return *this;
}

PathBuilder& PathBuilder::close() {
    commands_.emplace_back(ClosePath{});
    return *this;
}

Point path_origin(const Path& commands) {
    for (const PathCommand& command : commands) {
        if (const auto* move = std::get_if<MoveTo>(&command)) {
            return move->point;
        }
        if (!std::holds_alternative<ClosePath>(command)) {
            // Pen advanced before any MoveTo, so it started at the origin.
            break;
        }
    }
    return Point{};
}

} // namespace geometry
} // namespace pulsetrace
