#pragma once

#include <vector>

#include "geometry/path.h"
#include "geometry/path_sampler.h"
#include "geometry/point.h"

namespace pulsetrace {
namespace animation {

// Upper bound on particles per trail; larger counts are clamped.
constexpr int kMaxParticleCount = 1000;

struct TrailConfig {
    int particle_count = 10;
    // Arc-length fraction between neighbouring particles.
    float spacing = 0.015f;
    float base_size = 16.0f;
    float size_decay = 1.2f;
    float bpm_floor = 40.0f;
    // Heartbeats per full traversal of the path.
    float beats_per_cycle = 4.0f;
};

struct TrailParticle {
    int index = 0;
    float progress = 0.0f;
    geometry::Point point;
    float opacity = 1.0f;
    float size = 0.0f;
    bool is_lead = false;
};

// Seconds for one traversal. BPM below the floor, NaN or infinite, is raised
// to the floor.
double cycle_seconds(double bpm, const TrailConfig& config);

// fract(now / cycle) in [0, 1).
float base_progress(double now_s, double cycle_s);

// x - floor(x) in [0, 1); non-finite input maps to 0.
float wrap_progress(float x);

float particle_progress(float base, int index, float spacing);
float particle_opacity(int index, int count);
float particle_size(int index, const TrailConfig& config);

// Lead particle first. Pure function of its inputs; count <= 0 yields nothing
// and counts above kMaxParticleCount are clamped.
std::vector<TrailParticle> animate_trail(const geometry::SampledCurve& curve,
                                         double bpm,
                                         double now_s,
                                         const TrailConfig& config = TrailConfig{});

// One comet bound to one path.
class TrailAnimator {
public:
    explicit TrailAnimator(const TrailConfig& config = TrailConfig{},
                           const geometry::SamplerOptions& sampler_options = geometry::SamplerOptions{});
    TrailAnimator(const geometry::Path& commands,
                  const TrailConfig& config,
                  const geometry::SamplerOptions& sampler_options = geometry::SamplerOptions{});

    // Replaces the curve. Call whenever the path geometry changes.
    void rebuild(const geometry::Path& commands);

    std::vector<TrailParticle> frame(double bpm, double now_s) const;

    const TrailConfig& config() const { return config_; }
    void set_config(const TrailConfig& config) { config_ = config; }
    const geometry::PathSampler& sampler() const { return sampler_; }

private:
    TrailConfig config_;
    geometry::SamplerOptions sampler_options_;
    geometry::PathSampler sampler_;
};

} // namespace animation
} // namespace pulsetrace
