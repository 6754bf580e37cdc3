#pragma once

#include <string>
#include <vector>

#include "animation/trail_animator.h"
#include "config.h"
#include "geometry/path.h"

namespace pulsetrace {

struct Tracer {
    TracerConfig config;
    // Path in its own coordinates, before fitting to the drawing area.
    geometry::Path source_path;
    animation::TrailAnimator animator;
};

// Resolves the tracer's figure: SVG path data when given, otherwise the
// numbered shape. Unusable path data falls back to the shape with a warning.
geometry::Path resolve_tracer_path(const TracerConfig& config, std::vector<std::string>& warnings);

// Owns every animated path on screen, one curve per tracer.
class TracerScene {
public:
    void load(const AppConfig& config, std::vector<std::string>& warnings);

    // Refits every tracer into a width x height area and rebuilds its curve.
    void layout(float width, float height);

    // Tracer BPM override when present, else the global pulse.
    static double effective_bpm(const Tracer& tracer, double global_bpm);

    std::vector<Tracer>& tracers() { return tracers_; }
    const std::vector<Tracer>& tracers() const { return tracers_; }

    // Number override applied to every tracer that is not driven by path data.
    void set_shape(int number);
    void set_particle_count(int count);

private:
    std::vector<Tracer> tracers_;
    float width_ = 0.0f;
    float height_ = 0.0f;
};

} // namespace pulsetrace
