#pragma once

#include <cstdint>
#include <string>

namespace pulsetrace::config::detail {

// Each parser leaves `out` untouched and returns false when the text does
// not hold a complete, finite value of the requested type.
bool parse_bool(const std::string& text, bool& out);
bool parse_int32(const std::string& text, int& out);
bool parse_float32(const std::string& text, float& out);
bool parse_float64(const std::string& text, double& out);

// Accepts decimal, 0x-prefixed hex and #RRGGBB.
bool parse_color(const std::string& text, std::uint32_t& out);

} // namespace pulsetrace::config::detail
