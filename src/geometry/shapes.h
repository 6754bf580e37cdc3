#pragma once

#include "path.h"
#include "point.h"

namespace pulsetrace {
namespace geometry {

constexpr int kMinShapeNumber = 1;
constexpr int kMaxShapeNumber = 9;

// Folds any integer into 1..9 (1 -> 1, 10 -> 1, 0 -> 9, -1 -> 8).
int normalize_shape_number(int number);

// Tracing figure for a shape number:
//   1     circle from four cubic quarter arcs
//   2     vesica (lens) from two cubic arcs
//   3..9  regular polygon with that many vertices, first vertex on top
// Every figure is closed and starts with a MoveTo.
Path make_shape_path(int number, Point center, float radius);

Path make_circle_path(Point center, float radius);
Path make_vesica_path(Point center, float radius);
Path make_polygon_path(int sides, Point center, float radius);

// Uniformly scales and translates a path so its bounding box (control points
// included) is centred on `center` with its longer side equal to 2 * radius.
// A path with a single distinct point is only translated.
Path fit_path(const Path& commands, Point center, float radius);

} // namespace geometry
} // namespace pulsetrace
