#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "animation/trail_animator.h"
#include "geometry/path_sampler.h"

namespace pulsetrace {

struct VisualConfig {
    int target_fps = 60;
    bool show_status = true;
};

struct PulseConfig {
    double bpm = 72.0;
};

struct TracerConfig {
    int shape = 6;
    // SVG path data; takes precedence over `shape` when present.
    std::string path_data;
    std::optional<double> bpm;
    std::uint32_t color = 0x00FFFFu;
    int z_index = 0;
    // Figure radius as a fraction of half the smaller plane dimension.
    float scale = 0.85f;
};

struct AppConfig {
    VisualConfig visual;
    PulseConfig pulse;
    geometry::SamplerOptions sampler;
    animation::TrailConfig trail;
    std::vector<TracerConfig> tracers;
};

struct ConfigLoadResult {
    AppConfig config;
    std::vector<std::string> warnings;
    bool loaded_file = false;
};

// Never throws. A missing or unreadable file yields the built-in defaults;
// every rejected value leaves its default in place and adds a warning.
ConfigLoadResult load_app_config(const std::string& path);

} // namespace pulsetrace
