#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <vector>

#include "animation/trail_animator.h"
#include "geometry/path.h"
#include "geometry/path_sampler.h"

using pulsetrace::animation::TrailAnimator;
using pulsetrace::animation::TrailConfig;
using pulsetrace::animation::TrailParticle;
using pulsetrace::animation::animate_trail;
using pulsetrace::animation::base_progress;
using pulsetrace::animation::cycle_seconds;
using pulsetrace::animation::particle_opacity;
using pulsetrace::animation::particle_progress;
using pulsetrace::animation::particle_size;
using pulsetrace::animation::wrap_progress;
using pulsetrace::geometry::Path;
using pulsetrace::geometry::PathBuilder;
using pulsetrace::geometry::PathSampler;
using pulsetrace::geometry::Point;
using pulsetrace::geometry::SampledCurve;

namespace {

Path make_square(float side) {
    return PathBuilder{}.move_to(0, 0).line_to(side, 0).line_to(side, side).line_to(0, side).close().build();
}

void expect_same_particles(const std::vector<TrailParticle>& a, const std::vector<TrailParticle>& b) {
    ASSERT_EQ(a.size(), b.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].index, b[i].index);
        EXPECT_EQ(a[i].progress, b[i].progress);
        EXPECT_EQ(a[i].point, b[i].point);
        EXPECT_EQ(a[i].opacity, b[i].opacity);
        EXPECT_EQ(a[i].size, b[i].size);
        EXPECT_EQ(a[i].is_lead, b[i].is_lead);
    }
}

} // namespace

TEST(TrailAnimatorTest, DoublingBpmHalvesCycle) {
    const TrailConfig config;
    EXPECT_DOUBLE_EQ(cycle_seconds(60.0, config), 4.0);
    EXPECT_DOUBLE_EQ(cycle_seconds(120.0, config), 2.0);
    EXPECT_DOUBLE_EQ(cycle_seconds(72.0, config) / cycle_seconds(144.0, config), 2.0);
}

TEST(TrailAnimatorTest, InvalidBpmIsRaisedToFloor) {
    const TrailConfig config;
    const double floor_cycle = 60.0 / 40.0 * 4.0;
    EXPECT_DOUBLE_EQ(cycle_seconds(0.0, config), floor_cycle);
    EXPECT_DOUBLE_EQ(cycle_seconds(-15.0, config), floor_cycle);
    EXPECT_DOUBLE_EQ(cycle_seconds(25.0, config), floor_cycle);
    EXPECT_DOUBLE_EQ(cycle_seconds(std::numeric_limits<double>::quiet_NaN(), config), floor_cycle);
    EXPECT_DOUBLE_EQ(cycle_seconds(std::numeric_limits<double>::infinity(), config), floor_cycle);

    TrailConfig custom;
    custom.bpm_floor = 50.0f;
    custom.beats_per_cycle = 2.0f;
    EXPECT_DOUBLE_EQ(cycle_seconds(10.0, custom), 60.0 / 50.0 * 2.0);
}

TEST(TrailAnimatorTest, BaseProgressStaysInUnitInterval) {
    EXPECT_FLOAT_EQ(base_progress(5.0, 4.0), 0.25f);
    EXPECT_FLOAT_EQ(base_progress(1700000001.0, 4.0), 0.25f);
    EXPECT_EQ(base_progress(8.0, 4.0), 0.0f);
    EXPECT_FLOAT_EQ(base_progress(-1.0, 4.0), 0.75f);
    EXPECT_EQ(base_progress(std::numeric_limits<double>::quiet_NaN(), 4.0), 0.0f);

    for (int i = 0; i < 500; ++i) {
        const float progress = base_progress(1.7e9 + static_cast<double>(i) * 0.0137, 3.3333);
        EXPECT_GE(progress, 0.0f);
        EXPECT_LT(progress, 1.0f);
    }
}

TEST(TrailAnimatorTest, OverflowingCycleCountRestartsAtZero) {
    const double cycle = cycle_seconds(1e308, TrailConfig{});
    const float progress = base_progress(1.7e9, cycle);
    EXPECT_TRUE(std::isfinite(progress));
    EXPECT_EQ(progress, 0.0f);
    EXPECT_EQ(base_progress(1.0, std::numeric_limits<double>::denorm_min()), 0.0f);
}

TEST(TrailAnimatorTest, TrailSpacingWrapsBehindTheStart) {
    EXPECT_NEAR(particle_progress(0.05f, 0, 0.1f), 0.05f, 1e-6f);
    EXPECT_NEAR(particle_progress(0.05f, 1, 0.1f), 0.95f, 1e-6f);
    EXPECT_NEAR(particle_progress(0.05f, 2, 0.1f), 0.85f, 1e-6f);
}

TEST(TrailAnimatorTest, WrapProgressHandlesEdgeValues) {
    EXPECT_EQ(wrap_progress(0.0f), 0.0f);
    EXPECT_EQ(wrap_progress(1.0f), 0.0f);
    EXPECT_FLOAT_EQ(wrap_progress(2.25f), 0.25f);
    EXPECT_FLOAT_EQ(wrap_progress(-0.25f), 0.75f);
    EXPECT_EQ(wrap_progress(std::numeric_limits<float>::quiet_NaN()), 0.0f);
    EXPECT_EQ(wrap_progress(-std::numeric_limits<float>::infinity()), 0.0f);

    const float tiny = wrap_progress(-1e-9f);
    EXPECT_GE(tiny, 0.0f);
    EXPECT_LT(tiny, 1.0f);
}

TEST(TrailAnimatorTest, WeightsFadeAlongTheTail) {
    const TrailConfig config;
    EXPECT_FLOAT_EQ(particle_opacity(0, 10), 1.0f);
    EXPECT_FLOAT_EQ(particle_opacity(9, 10), 1.0f - 9.0f / 12.0f);
    EXPECT_FLOAT_EQ(particle_size(0, config), 16.0f);
    EXPECT_FLOAT_EQ(particle_size(5, config), 10.0f);

    for (int i = 1; i < config.particle_count; ++i) {
        EXPECT_LT(particle_opacity(i, config.particle_count), particle_opacity(i - 1, config.particle_count));
        EXPECT_GT(particle_opacity(i, config.particle_count), 0.0f);
        EXPECT_LT(particle_size(i, config), particle_size(i - 1, config));
    }

    EXPECT_EQ(particle_size(40, config), 0.0f);
}

TEST(TrailAnimatorTest, NoParticlesForEmptyTrail) {
    const SampledCurve curve = PathSampler::build(make_square(10.0f));
    TrailConfig config;
    config.particle_count = 0;
    EXPECT_TRUE(animate_trail(curve, 72.0, 12.0, config).empty());
    config.particle_count = -3;
    EXPECT_TRUE(animate_trail(curve, 72.0, 12.0, config).empty());
}

TEST(TrailAnimatorTest, HugeParticleCountIsClamped) {
    const SampledCurve curve = PathSampler::build(make_square(10.0f));
    TrailConfig config;
    config.particle_count = 2000000000;
    const std::vector<TrailParticle> particles = animate_trail(curve, 72.0, 12.0, config);
    ASSERT_EQ(particles.size(), static_cast<std::size_t>(pulsetrace::animation::kMaxParticleCount));
    EXPECT_TRUE(particles.front().is_lead);
    EXPECT_GT(particles.back().opacity, 0.0f);
}

TEST(TrailAnimatorTest, LeadParticleTracksBaseProgress) {
    const SampledCurve curve = PathSampler::build(make_square(10.0f));
    TrailConfig config;
    config.particle_count = 3;
    config.spacing = 0.125f;

    // 60 bpm -> 4 s cycle, t = 1 s -> quarter of the way round.
    const std::vector<TrailParticle> particles = animate_trail(curve, 60.0, 1.0, config);
    ASSERT_EQ(particles.size(), 3u);

    EXPECT_TRUE(particles[0].is_lead);
    EXPECT_FALSE(particles[1].is_lead);
    EXPECT_FALSE(particles[2].is_lead);

    EXPECT_FLOAT_EQ(particles[0].progress, 0.25f);
    EXPECT_EQ(particles[0].point, (Point{10.0f, 0.0f}));
    EXPECT_FLOAT_EQ(particles[1].point.x, 5.0f);
    EXPECT_FLOAT_EQ(particles[1].point.y, 0.0f);
    EXPECT_EQ(particles[2].point, (Point{0.0f, 0.0f}));

    EXPECT_FLOAT_EQ(particles[0].opacity, 1.0f);
    EXPECT_FLOAT_EQ(particles[2].opacity, 1.0f - 2.0f / 3.6f);
}

TEST(TrailAnimatorTest, TailWrapsPastTheJoin) {
    const SampledCurve curve = PathSampler::build(make_square(10.0f));
    TrailConfig config;
    config.particle_count = 2;
    config.spacing = 0.125f;

    // Base progress 0.0625: the second particle sits on the closing edge.
    const std::vector<TrailParticle> particles = animate_trail(curve, 60.0, 0.25, config);
    ASSERT_EQ(particles.size(), 2u);
    EXPECT_FLOAT_EQ(particles[1].progress, 0.9375f);
    EXPECT_FLOAT_EQ(particles[1].point.x, 0.0f);
    EXPECT_FLOAT_EQ(particles[1].point.y, 2.5f);
}

TEST(TrailAnimatorTest, OutputRepeatsEveryCycle) {
    const SampledCurve curve = PathSampler::build(make_square(10.0f));
    const TrailConfig config;

    // 60 bpm gives an exactly representable 4 s cycle.
    const double now = 1000.5;
    const auto reference = animate_trail(curve, 60.0, now, config);
    for (int k = -3; k <= 3; ++k) {
        expect_same_particles(animate_trail(curve, 60.0, now + 4.0 * k, config), reference);
    }

    const double cycle = cycle_seconds(72.0, config);
    const auto at_72 = animate_trail(curve, 72.0, 37.2, config);
    const auto next_72 = animate_trail(curve, 72.0, 37.2 + 5.0 * cycle, config);
    ASSERT_EQ(at_72.size(), next_72.size());
    for (std::size_t i = 0; i < at_72.size(); ++i) {
        EXPECT_NEAR(at_72[i].point.x, next_72[i].point.x, 1e-3f);
        EXPECT_NEAR(at_72[i].point.y, next_72[i].point.y, 1e-3f);
    }
}

TEST(TrailAnimatorTest, DegenerateCurveCollapsesToFallback) {
    const SampledCurve curve = PathSampler::build(PathBuilder{}.move_to(5, 5).build());
    const auto particles = animate_trail(curve, 0.0, 123.456, TrailConfig{});
    ASSERT_EQ(particles.size(), 10u);
    for (const TrailParticle& particle : particles) {
        EXPECT_EQ(particle.point, (Point{5.0f, 5.0f}));
    }
}

TEST(TrailAnimatorTest, FramesDependOnlyOnInputs) {
    const TrailAnimator animator(make_square(10.0f), TrailConfig{});
    const auto later = animator.frame(88.0, 20.0);
    const auto earlier = animator.frame(88.0, 10.0);
    expect_same_particles(animator.frame(88.0, 20.0), later);
    expect_same_particles(animator.frame(88.0, 10.0), earlier);
}

TEST(TrailAnimatorTest, RebuildReplacesTheCurve) {
    TrailAnimator animator(make_square(10.0f), TrailConfig{});
    EXPECT_EQ(animator.frame(60.0, 1.0).front().point, (Point{10.0f, 0.0f}));

    animator.rebuild(make_square(20.0f));
    EXPECT_FLOAT_EQ(animator.sampler().curve().total_length(), 80.0f);
    EXPECT_EQ(animator.frame(60.0, 1.0).front().point, (Point{20.0f, 0.0f}));

    TrailAnimator empty;
    const auto particles = empty.frame(60.0, 1.0);
    ASSERT_EQ(particles.size(), 10u);
    EXPECT_EQ(particles.front().point, (Point{0.0f, 0.0f}));
}
