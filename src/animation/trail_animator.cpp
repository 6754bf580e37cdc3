#include "trail_animator.h"

#include <algorithm>
#include <cmath>

namespace pulsetrace {
namespace animation {

namespace {
constexpr double kSecondsPerMinute = 60.0;
constexpr float kOpacityFalloff = 1.2f;
constexpr double kFallbackBpmFloor = 40.0;
}

double cycle_seconds(double bpm, const TrailConfig& config) {
    double floor_bpm = static_cast<double>(config.bpm_floor);
    if (!std::isfinite(floor_bpm) || floor_bpm <= 0.0) {
        floor_bpm = kFallbackBpmFloor;
    }
    const double effective_bpm = std::isfinite(bpm) ? std::max(bpm, floor_bpm) : floor_bpm;

    double beats = static_cast<double>(config.beats_per_cycle);
    if (!std::isfinite(beats) || beats <= 0.0) {
        beats = 1.0;
    }
    return kSecondsPerMinute / effective_bpm * beats;
}

float base_progress(double now_s, double cycle_s) {
    if (!std::isfinite(now_s) || !std::isfinite(cycle_s) || cycle_s <= 0.0) {
        return 0.0f;
    }
    const double cycles = now_s / cycle_s;
    if (!std::isfinite(cycles)) {
        return 0.0f;
    }
    const float progress = static_cast<float>(cycles - std::floor(cycles));
    return progress >= 1.0f ? 0.0f : progress;
}

float wrap_progress(float x) {
    if (!std::isfinite(x)) {
        return 0.0f;
    }
    const float wrapped = x - std::floor(x);
    // Tiny negative inputs round up to exactly 1.
    return wrapped >= 1.0f ? 0.0f : wrapped;
}

float particle_progress(float base, int index, float spacing) {
    return wrap_progress(base - static_cast<float>(index) * spacing);
}

float particle_opacity(int index, int count) {
    if (count <= 0) {
        return 0.0f;
    }
    return 1.0f - static_cast<float>(index) / (static_cast<float>(count) * kOpacityFalloff);
}

float particle_size(int index, const TrailConfig& config) {
    return std::max(0.0f, config.base_size - static_cast<float>(index) * config.size_decay);
}

std::vector<TrailParticle> animate_trail(const geometry::SampledCurve& curve,
                                         double bpm,
                                         double now_s,
                                         const TrailConfig& config) {
    std::vector<TrailParticle> particles;
    if (config.particle_count <= 0) {
        return particles;
    }

    const int count = std::min(config.particle_count, kMaxParticleCount);
    const float base = base_progress(now_s, cycle_seconds(bpm, config));
    particles.reserve(static_cast<std::size_t>(count));
    for (int i = 0; i < count; ++i) {
        TrailParticle particle;
        particle.index = i;
        particle.progress = particle_progress(base, i, config.spacing);
        particle.point = geometry::PathSampler::point_at(curve, particle.progress);
        particle.opacity = particle_opacity(i, count);
        particle.size = particle_size(i, config);
        particle.is_lead = i == 0;
        particles.push_back(particle);
    }
    return particles;
}

TrailAnimator::TrailAnimator(const TrailConfig& config, const geometry::SamplerOptions& sampler_options)
    : config_(config), sampler_options_(sampler_options) {}

TrailAnimator::TrailAnimator(const geometry::Path& commands,
                             const TrailConfig& config,
                             const geometry::SamplerOptions& sampler_options)
    : config_(config), sampler_options_(sampler_options), sampler_(commands, sampler_options) {}

void TrailAnimator::rebuild(const geometry::Path& commands) {
    sampler_ = geometry::PathSampler(commands, sampler_options_);
}

std::vector<TrailParticle> TrailAnimator::frame(double bpm, double now_s) const {
    return animate_trail(sampler_.curve(), bpm, now_s, config_);
}

} // namespace animation
} // namespace pulsetrace
