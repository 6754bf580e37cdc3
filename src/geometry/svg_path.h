#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "path.h"

namespace pulsetrace {
namespace geometry {

// Parses SVG path data ("M 0 0 L 10 0 C ... Z") into path commands.
// Supports M L H V C S Z in absolute and relative form. Q, T and A are
// rejected. On failure a warning is appended and std::nullopt returned.
std::optional<Path> parse_svg_path(std::string_view data, std::vector<std::string>& warnings);

} // namespace geometry
} // namespace pulsetrace
