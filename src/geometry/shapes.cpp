#include "shapes.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <variant>

namespace pulsetrace {
namespace geometry {

namespace {
constexpr float kPi = 3.14159265358979323846f;
// Control point distance for a quarter circle cubic.
constexpr float kCircleKappa = 0.5522847498f;
// Lens half-width relative to the radius.
constexpr float kVesicaWidthRatio = 0.58f;
}

int normalize_shape_number(int number) {
    return ((number - 1) % kMaxShapeNumber + kMaxShapeNumber) % kMaxShapeNumber + 1;
}

Path make_circle_path(Point center, float radius) {
    const float r = std::max(radius, 0.0f);
    const float k = r * kCircleKappa;
    const float cx = center.x;
    const float cy = center.y;

    PathBuilder builder;
    builder.move_to(cx, cy - r)
        .curve_to({cx + r, cy}, {cx + k, cy - r}, {cx + r, cy - k})
        .curve_to({cx, cy + r}, {cx + r, cy + k}, {cx + k, cy + r})
        .curve_to({cx - r, cy}, {cx - k, cy + r}, {cx - r, cy + k})
        .curve_to({cx, cy - r}, {cx - r, cy - k}, {cx - k, cy - r})
        .close();
    return builder.build();
}

Path make_vesica_path(Point center, float radius) {
    const float r = std::max(radius, 0.0f);
    const float w = r * kVesicaWidthRatio;
    const float cx = center.x;
    const float cy = center.y;

    const Point top{cx, cy - r};
    const Point bottom{cx, cy + r};

    PathBuilder builder;
    builder.move_to(top)
        .curve_to(bottom, {cx + w * 1.33f, cy - r * 0.45f}, {cx + w * 1.33f, cy + r * 0.45f})
        .curve_to(top, {cx - w * 1.33f, cy + r * 0.45f}, {cx - w * 1.33f, cy - r * 0.45f})
        .close();
    return builder.build();
}

Path make_polygon_path(int sides, Point center, float radius) {
    const int vertex_count = std::max(3, sides);
    const float r = std::max(radius, 0.0f);

    PathBuilder builder;
    for (int i = 0; i < vertex_count; ++i) {
        const float angle = static_cast<float>(i) * 2.0f * kPi / static_cast<float>(vertex_count) - kPi / 2.0f;
        const Point vertex{center.x + r * std::cos(angle), center.y + r * std::sin(angle)};
        if (i == 0) {
            builder.move_to(vertex);
        } else {
            builder.line_to(vertex);
        }
    }
    builder.close();
    return builder.build();
}

Path fit_path(const Path& commands, Point center, float radius) {
    float min_x = std::numeric_limits<float>::max();
    float min_y = std::numeric_limits<float>::max();
    float max_x = std::numeric_limits<float>::lowest();
    float max_y = std::numeric_limits<float>::lowest();
    bool any_point = false;

    auto extend = [&](const Point& p) {
        min_x = std::min(min_x, p.x);
        min_y = std::min(min_y, p.y);
        max_x = std::max(max_x, p.x);
        max_y = std::max(max_y, p.y);
        any_point = true;
    };

    for (const PathCommand& command : commands) {
        if (const auto* move = std::get_if<MoveTo>(&command)) {
            extend(move->point);
        } else if (const auto* line = std::get_if<LineTo>(&command)) {
            extend(line->point);
        } else if (const auto* curve = std::get_if<CurveTo>(&command)) {
            extend(curve->point);
            extend(curve->control_a);
            extend(curve->control_b);
        }
    }
    if (!any_point) {
        return commands;
    }

    const float extent = std::max(max_x - min_x, max_y - min_y);
    const float scale = extent > 0.0f ? 2.0f * std::max(radius, 0.0f) / extent : 1.0f;
    const Point box_center{(min_x + max_x) * 0.5f, (min_y + max_y) * 0.5f};

    auto map = [&](const Point& p) {
        return Point{center.x + (p.x - box_center.x) * scale,
                     center.y + (p.y - box_center.y) * scale};
    };

    Path fitted;
    fitted.reserve(commands.size());
    for (const PathCommand& command : commands) {
        if (const auto* move = std::get_if<MoveTo>(&command)) {
            fitted.emplace_back(MoveTo{map(move->point)});
        } else if (const auto* line = std::get_if<LineTo>(&command)) {
            fitted.emplace_back(LineTo{map(line->point)});
        } else if (const auto* curve = std::get_if<CurveTo>(&command)) {
            fitted.emplace_back(CurveTo{map(curve->point), map(curve->control_a), map(curve->control_b)});
        } else {
            fitted.emplace_back(ClosePath{});
        }
    }
    return fitted;
}

Path make_shape_path(int number, Point center, float radius) {
    const int shape = normalize_shape_number(number);
    switch (shape) {
    case 1:
        return make_circle_path(center, radius);
    case 2:
        return make_vesica_path(center, radius);
    default:
        return make_polygon_path(shape, center, radius);
    }
}

} // namespace geometry
} // namespace pulsetrace
