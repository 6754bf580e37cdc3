#include "tracer_config_parser.h"

#include <sstream>

#include "../geometry/shapes.h"
#include "../geometry/svg_path.h"
#include "value_parsers.h"

namespace pulsetrace::config::detail {

namespace {

void warn_invalid(const std::string& key,
                  const RawScalar& scalar,
                  std::vector<std::string>& warnings) {
    std::ostringstream oss;
    oss << "Invalid value '" << scalar.value << "' for tracer key '" << key
        << "' (line " << scalar.line << ")";
    warnings.push_back(oss.str());
}

} // namespace

std::optional<TracerConfig> parse_tracer_config(
    const std::unordered_map<std::string, RawScalar>& raw_tracer_config,
    std::vector<std::string>& warnings) {
    TracerConfig tracer;

    for (const auto& [key, scalar] : raw_tracer_config) {
        if (key == "shape") {
            int shape = tracer.shape;
            if (!parse_int32(scalar.value, shape)) {
                warn_invalid(key, scalar, warnings);
                continue;
            }
            const int normalized = geometry::normalize_shape_number(shape);
            if (normalized != shape) {
                std::ostringstream oss;
                oss << "Tracer shape " << shape << " folded into " << normalized
                    << " (line " << scalar.line << ")";
                warnings.push_back(oss.str());
            }
            tracer.shape = normalized;
        } else if (key == "path") {
            const std::string data = sanitize_string_value(scalar.value);
            std::vector<std::string> path_warnings;
            if (!geometry::parse_svg_path(data, path_warnings)) {
                for (const std::string& warning : path_warnings) {
                    std::ostringstream oss;
                    oss << warning << " (line " << scalar.line << ")";
                    warnings.push_back(oss.str());
                }
                warnings.push_back("Dropping tracer with unusable path data");
                return std::nullopt;
            }
            tracer.path_data = data;
        } else if (key == "bpm") {
            double bpm = 0.0;
            if (!parse_float64(scalar.value, bpm)) {
                warn_invalid(key, scalar, warnings);
                continue;
            }
            tracer.bpm = bpm;
        } else if (key == "color") {
            if (!parse_color(scalar.value, tracer.color)) {
                warn_invalid(key, scalar, warnings);
            }
        } else if (key == "z_index") {
            if (!parse_int32(scalar.value, tracer.z_index)) {
                warn_invalid(key, scalar, warnings);
            }
        } else if (key == "scale") {
            float scale = tracer.scale;
            if (!parse_float32(scalar.value, scale) || scale <= 0.0f) {
                warn_invalid(key, scalar, warnings);
                continue;
            }
            tracer.scale = scale;
        } else {
            std::ostringstream oss;
            oss << "Unknown tracer key '" << key << "' (line " << scalar.line << ")";
            warnings.push_back(oss.str());
        }
    }

    return tracer;
}

} // namespace pulsetrace::config::detail
