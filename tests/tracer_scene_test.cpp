#include <gtest/gtest.h>

#include <algorithm>
#include <limits>
#include <string>
#include <vector>

#include "config.h"
#include "renderer/braille_canvas.h"
#include "tracer_scene.h"

using pulsetrace::AppConfig;
using pulsetrace::Tracer;
using pulsetrace::TracerConfig;
using pulsetrace::TracerScene;
using pulsetrace::geometry::Point;
using pulsetrace::geometry::Segment;
using pulsetrace::renderer::BrailleCanvas;
using pulsetrace::renderer::Rgb;

namespace {

struct Bounds {
    float min_x = 1e9f;
    float min_y = 1e9f;
    float max_x = -1e9f;
    float max_y = -1e9f;
};

Bounds curve_bounds(const Tracer& tracer) {
    Bounds bounds;
    for (const Segment& segment : tracer.animator.sampler().curve().segments()) {
        for (const Point& p : {segment.start, segment.end}) {
            bounds.min_x = std::min(bounds.min_x, p.x);
            bounds.min_y = std::min(bounds.min_y, p.y);
            bounds.max_x = std::max(bounds.max_x, p.x);
            bounds.max_y = std::max(bounds.max_y, p.y);
        }
    }
    return bounds;
}

} // namespace

TEST(TracerSceneTest, LayoutFitsFigureIntoArea) {
    AppConfig config;
    config.tracers.push_back(TracerConfig{});

    std::vector<std::string> warnings;
    TracerScene scene;
    scene.load(config, warnings);
    EXPECT_TRUE(warnings.empty());
    ASSERT_EQ(scene.tracers().size(), 1u);

    scene.layout(100.0f, 60.0f);
    const Bounds bounds = curve_bounds(scene.tracers().front());

    // Hexagon with a vertex on top: its height is the longer side.
    EXPECT_NEAR(bounds.max_y - bounds.min_y, 60.0f * 0.85f, 1e-3f);
    EXPECT_NEAR((bounds.min_x + bounds.max_x) * 0.5f, 50.0f, 1e-3f);
    EXPECT_NEAR((bounds.min_y + bounds.max_y) * 0.5f, 30.0f, 1e-3f);
    EXPECT_EQ(scene.tracers().front().animator.sampler().curve().segments().size(), 6u);
}

TEST(TracerSceneTest, PathDataOverridesShape) {
    AppConfig config;
    TracerConfig tracer;
    tracer.shape = 1;
    tracer.path_data = "M0 0 L10 0 L10 10 L0 10 Z";
    config.tracers.push_back(tracer);

    std::vector<std::string> warnings;
    TracerScene scene;
    scene.load(config, warnings);
    scene.layout(40.0f, 40.0f);

    const auto& curve = scene.tracers().front().animator.sampler().curve();
    ASSERT_EQ(curve.segments().size(), 4u);
    EXPECT_NEAR(curve.total_length(), 4.0f * 40.0f * 0.85f, 1e-3f);

    scene.set_shape(5);
    EXPECT_EQ(scene.tracers().front().config.shape, 1);
    EXPECT_EQ(scene.tracers().front().animator.sampler().curve().segments().size(), 4u);
}

TEST(TracerSceneTest, BrokenPathDataFallsBackToShape) {
    TracerConfig tracer;
    tracer.shape = 4;
    tracer.path_data = "M0 0 Q 1 1 2 2";

    std::vector<std::string> warnings;
    const auto path = pulsetrace::resolve_tracer_path(tracer, warnings);
    EXPECT_EQ(path.size(), 5u);
    EXPECT_GE(warnings.size(), 2u);
}

TEST(TracerSceneTest, SceneOrdersTracersByZIndexAndAppliesOverrides) {
    AppConfig config;
    TracerConfig top;
    top.z_index = 5;
    top.shape = 3;
    top.bpm = 110.0;
    TracerConfig bottom;
    bottom.z_index = -1;
    bottom.shape = 9;
    config.tracers = {top, bottom};

    std::vector<std::string> warnings;
    TracerScene scene;
    scene.load(config, warnings);
    ASSERT_EQ(scene.tracers().size(), 2u);
    EXPECT_EQ(scene.tracers()[0].config.z_index, -1);
    EXPECT_EQ(scene.tracers()[1].config.z_index, 5);

    EXPECT_DOUBLE_EQ(TracerScene::effective_bpm(scene.tracers()[0], 72.0), 72.0);
    EXPECT_DOUBLE_EQ(TracerScene::effective_bpm(scene.tracers()[1], 72.0), 110.0);

    scene.layout(50.0f, 50.0f);
    scene.set_shape(7);
    scene.set_particle_count(4);
    for (const Tracer& tracer : scene.tracers()) {
        EXPECT_EQ(tracer.config.shape, 7);
        EXPECT_EQ(tracer.animator.sampler().curve().segments().size(), 7u);
        EXPECT_EQ(tracer.animator.frame(72.0, 3.0).size(), 4u);
    }
}

TEST(BrailleCanvasTest, SplatSetsCoveredDots) {
    BrailleCanvas canvas;
    canvas.resize(2, 2);
    EXPECT_EQ(canvas.dot_width(), 4);
    EXPECT_EQ(canvas.dot_height(), 8);

    EXPECT_TRUE(canvas.splat(Point{0.0f, 0.0f}, 0.5f, 1.0f, Rgb{1.0f, 0.5f, 0.0f}));
    EXPECT_EQ(canvas.mask(0, 0), 0x01u);
    EXPECT_FLOAT_EQ(canvas.color(0, 0).r, 1.0f);
    EXPECT_FLOAT_EQ(canvas.color(0, 0).g, 0.5f);
    EXPECT_EQ(BrailleCanvas::glyph(canvas.mask(0, 0)), U'\u2801');

    EXPECT_TRUE(canvas.splat(Point{3.0f, 7.0f}, 0.5f, 1.0f, Rgb{1.0f, 1.0f, 1.0f}));
    EXPECT_EQ(canvas.mask(1, 1), 0x80u);

    EXPECT_FALSE(canvas.splat(Point{40.0f, 40.0f}, 1.0f, 1.0f, Rgb{1.0f, 1.0f, 1.0f}));
    EXPECT_FALSE(canvas.splat(Point{1.0f, 1.0f}, 1.0f, 0.0f, Rgb{1.0f, 1.0f, 1.0f}));

    canvas.clear();
    EXPECT_EQ(canvas.mask(0, 0), 0u);
    EXPECT_EQ(canvas.mask(1, 1), 0u);
}

TEST(BrailleCanvasTest, HugeRadiusCoversWholeCanvas) {
    BrailleCanvas canvas;
    canvas.resize(10, 10);

    EXPECT_TRUE(canvas.splat(Point{5.0f, 5.0f}, 1.5e29f, 1.0f, Rgb{1.0f, 1.0f, 1.0f}));
    for (int row = 0; row < canvas.rows(); ++row) {
        for (int col = 0; col < canvas.cols(); ++col) {
            EXPECT_EQ(canvas.mask(row, col), 0xFFu) << row << "," << col;
        }
    }

    canvas.clear();
    EXPECT_TRUE(canvas.splat(Point{-1.0e18f, 5.0f}, 1.5e18f, 1.0f, Rgb{1.0f, 1.0f, 1.0f}));
    EXPECT_NE(canvas.mask(0, 0), 0u);
    EXPECT_FALSE(canvas.splat(Point{5.0f, 5.0f}, std::numeric_limits<float>::quiet_NaN(), 1.0f,
                              Rgb{1.0f, 1.0f, 1.0f}));
}

TEST(TracerSceneTest, ParticleOverrideIsClamped) {
    AppConfig config;
    config.tracers.push_back(TracerConfig{});

    std::vector<std::string> warnings;
    TracerScene scene;
    scene.load(config, warnings);
    scene.set_particle_count(5000);
    EXPECT_EQ(scene.tracers().front().animator.config().particle_count,
              pulsetrace::animation::kMaxParticleCount);
    scene.set_particle_count(-4);
    EXPECT_EQ(scene.tracers().front().animator.config().particle_count, 0);
}

TEST(BrailleCanvasTest, HexColourUnpacksToUnitChannels) {
    const Rgb color = pulsetrace::renderer::rgb_from_hex(0xFF8000u);
    EXPECT_FLOAT_EQ(color.r, 1.0f);
    EXPECT_NEAR(color.g, 128.0f / 255.0f, 1e-6f);
    EXPECT_FLOAT_EQ(color.b, 0.0f);
}
