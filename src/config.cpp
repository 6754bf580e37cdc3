#include "config.h"

#include <functional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>

#include "config/raw_config.h"
#include "config/tracer_config_parser.h"
#include "config/value_parsers.h"

namespace pulsetrace {

namespace {

using config::detail::RawConfig;
using config::detail::RawScalar;

using ScalarApplier = std::function<bool(const std::string&)>;

// Particle sizes are in braille sub-cells; anything larger covers every terminal.
constexpr float kMaxParticleSize = 1000.0f;

void warn_invalid(const std::string& key, const RawScalar& scalar, std::vector<std::string>& warnings) {
    std::ostringstream oss;
    oss << "Invalid value '" << scalar.value << "' for '" << key << "' (line " << scalar.line
        << "); keeping default";
    warnings.push_back(oss.str());
}

ScalarApplier int_at_least(int& target, int minimum) {
    return [&target, minimum](const std::string& text) {
        int value = 0;
        if (!config::detail::parse_int32(text, value) || value < minimum) {
            return false;
        }
        target = value;
        return true;
    };
}

ScalarApplier int_in_range(int& target, int lo, int hi) {
    return [&target, lo, hi](const std::string& text) {
        int value = 0;
        if (!config::detail::parse_int32(text, value) || value < lo || value > hi) {
            return false;
        }
        target = value;
        return true;
    };
}

ScalarApplier any_float(float& target) {
    return [&target](const std::string& text) {
        return config::detail::parse_float32(text, target);
    };
}

ScalarApplier float_in_range(float& target, float lo, float hi) {
    return [&target, lo, hi](const std::string& text) {
        float value = 0.0f;
        if (!config::detail::parse_float32(text, value) || !(value >= lo && value <= hi)) {
            return false;
        }
        target = value;
        return true;
    };
}

ScalarApplier positive_float(float& target) {
    return [&target](const std::string& text) {
        float value = 0.0f;
        if (!config::detail::parse_float32(text, value) || value <= 0.0f) {
            return false;
        }
        target = value;
        return true;
    };
}

ScalarApplier any_double(double& target) {
    return [&target](const std::string& text) {
        return config::detail::parse_float64(text, target);
    };
}

ScalarApplier any_bool(bool& target) {
    return [&target](const std::string& text) {
        return config::detail::parse_bool(text, target);
    };
}

void apply_scalars(const RawConfig& raw, AppConfig& config, std::vector<std::string>& warnings) {
    const std::unordered_map<std::string, ScalarApplier> appliers{
        {"visual.target_fps", int_at_least(config.visual.target_fps, 1)},
        {"visual.show_status", any_bool(config.visual.show_status)},
        {"pulse.bpm", any_double(config.pulse.bpm)},
        {"sampler.curve_subdivisions", int_at_least(config.sampler.curve_subdivisions, 1)},
        {"trail.particle_count",
         int_in_range(config.trail.particle_count, 0, animation::kMaxParticleCount)},
        {"trail.spacing", any_float(config.trail.spacing)},
        {"trail.base_size", float_in_range(config.trail.base_size, 0.0f, kMaxParticleSize)},
        {"trail.size_decay", float_in_range(config.trail.size_decay, 0.0f, kMaxParticleSize)},
        {"trail.bpm_floor", positive_float(config.trail.bpm_floor)},
        {"trail.beats_per_cycle", positive_float(config.trail.beats_per_cycle)},
    };

    for (const auto& [key, scalar] : raw.scalars) {
        const auto it = appliers.find(key);
        if (it == appliers.end()) {
            std::ostringstream oss;
            oss << "Unknown configuration key '" << key << "' (line " << scalar.line << ")";
            warnings.push_back(oss.str());
            continue;
        }
        if (!it->second(scalar.value)) {
            warn_invalid(key, scalar, warnings);
        }
    }
}

} // namespace

ConfigLoadResult load_app_config(const std::string& path) {
    ConfigLoadResult result;
    const RawConfig raw = config::detail::parse_raw_config(path, result.warnings, result.loaded_file);

    apply_scalars(raw, result.config, result.warnings);

    for (const auto& raw_tracer : raw.tracer_configs) {
        if (auto tracer = config::detail::parse_tracer_config(raw_tracer, result.warnings)) {
            result.config.tracers.push_back(std::move(*tracer));
        }
    }

    if (result.config.tracers.empty()) {
        result.config.tracers.push_back(TracerConfig{});
    }

    return result;
}

} // namespace pulsetrace
