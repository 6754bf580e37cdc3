#include "tracer_scene.h"

#include <algorithm>
#include <string>
#include <utility>

#include "geometry/shapes.h"
#include "geometry/svg_path.h"

namespace pulsetrace {

geometry::Path resolve_tracer_path(const TracerConfig& config, std::vector<std::string>& warnings) {
    if (!config.path_data.empty()) {
        if (auto parsed = geometry::parse_svg_path(config.path_data, warnings)) {
            return std::move(*parsed);
        }
        warnings.push_back("Tracer path data rejected; using shape " + std::to_string(config.shape));
    }
    return geometry::make_shape_path(config.shape, geometry::Point{0.0f, 0.0f}, 1.0f);
}

void TracerScene::load(const AppConfig& config, std::vector<std::string>& warnings) {
    tracers_.clear();
    tracers_.reserve(config.tracers.size());

    for (const TracerConfig& tracer_config : config.tracers) {
        Tracer tracer{tracer_config,
                      resolve_tracer_path(tracer_config, warnings),
                      animation::TrailAnimator(config.trail, config.sampler)};
        tracers_.push_back(std::move(tracer));
    }

    std::stable_sort(tracers_.begin(), tracers_.end(), [](const Tracer& a, const Tracer& b) {
        return a.config.z_index < b.config.z_index;
    });

    if (width_ > 0.0f && height_ > 0.0f) {
        layout(width_, height_);
    }
}

void TracerScene::layout(float width, float height) {
    width_ = std::max(width, 0.0f);
    height_ = std::max(height, 0.0f);

    const geometry::Point center{width_ * 0.5f, height_ * 0.5f};
    const float half_extent = std::min(width_, height_) * 0.5f;

    for (Tracer& tracer : tracers_) {
        const float radius = half_extent * tracer.config.scale;
        tracer.animator.rebuild(geometry::fit_path(tracer.source_path, center, radius));
    }
}

double TracerScene::effective_bpm(const Tracer& tracer, double global_bpm) {
    return tracer.config.bpm.value_or(global_bpm);
}

void TracerScene::set_shape(int number) {
    const int shape = geometry::normalize_shape_number(number);
    for (Tracer& tracer : tracers_) {
        if (!tracer.config.path_data.empty()) {
            continue;
        }
        tracer.config.shape = shape;
        tracer.source_path = geometry::make_shape_path(shape, geometry::Point{0.0f, 0.0f}, 1.0f);
    }
    if (width_ > 0.0f && height_ > 0.0f) {
        layout(width_, height_);
    }
}

void TracerScene::set_particle_count(int count) {
    for (Tracer& tracer : tracers_) {
        animation::TrailConfig trail = tracer.animator.config();
        trail.particle_count = std::clamp(count, 0, animation::kMaxParticleCount);
        tracer.animator.set_config(trail);
    }
}

} // namespace pulsetrace
