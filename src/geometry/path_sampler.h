#pragma once

#include <cstddef>
#include <vector>

#include "path.h"
#include "point.h"

namespace pulsetrace {
namespace geometry {

struct Segment {
    Point start;
    Point end;
    float length = 0.0f;
};

struct SamplerOptions {
    // Chords emitted per CurveTo. 1 keeps the plain start-to-anchor chord and
    // ignores the control points.
    int curve_subdivisions = 1;
};

// Arc-length parametrised polyline built from a Path. Immutable once built.
class SampledCurve {
public:
    SampledCurve() = default;

    const std::vector<Segment>& segments() const { return segments_; }
    // cumulative_lengths()[i] is the arc length at the end of segment i.
    const std::vector<float>& cumulative_lengths() const { return cumulative_; }
    float total_length() const { return total_length_; }
    Point fallback_point() const { return fallback_; }

    // True when every query collapses onto fallback_point().
    bool is_degenerate() const { return degenerate_; }

private:
    friend class PathSampler;

    std::vector<Segment> segments_;
    std::vector<float> cumulative_;
    float total_length_ = 0.0f;
    Point fallback_;
    bool degenerate_ = true;
};

// Resolves normalised arc-length positions on one path. A sampler must be
// rebuilt whenever the geometry it was built from changes; nothing here
// detects a stale curve.
class PathSampler {
public:
    PathSampler() = default;
    explicit PathSampler(const Path& commands, const SamplerOptions& options = SamplerOptions{});

    static SampledCurve build(const Path& commands, const SamplerOptions& options = SamplerOptions{});

    // t is clamped into [0, 1]; non-finite t reads as 0.
    static Point point_at(const SampledCurve& curve, float t);

    Point point_at(float t) const { return point_at(curve_, t); }
    const SampledCurve& curve() const { return curve_; }

private:
    SampledCurve curve_;
};

} // namespace geometry
} // namespace pulsetrace
