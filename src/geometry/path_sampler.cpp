#include "path_sampler.h"

#include <algorithm>
#include <cmath>
#include <utility>
#include <variant>

namespace pulsetrace {
namespace geometry {

namespace {

Point cubic_point(const Point& p0, const Point& c1, const Point& c2, const Point& p3, float t) {
    const float u = 1.0f - t;
    const float b0 = u * u * u;
    const float b1 = 3.0f * u * u * t;
    const float b2 = 3.0f * u * t * t;
    const float b3 = t * t * t;
    return Point{b0 * p0.x + b1 * c1.x + b2 * c2.x + b3 * p3.x,
                 b0 * p0.y + b1 * c1.y + b2 * c2.y + b3 * p3.y};
}

class SegmentCollector {
public:
    explicit SegmentCollector(const SamplerOptions& options)
        : subdivisions_(std::max(1, options.curve_subdivisions)) {}

    void operator()(const MoveTo& command) {
        pen_ = command.point;
    }

    void operator()(const LineTo& command) {
        emit(pen_, command.point);
        pen_ = command.point;
    }

    void operator()(const CurveTo& command) {
        if (subdivisions_ == 1) {
            emit(pen_, command.point);
        } else {
            const Point start = pen_;
            Point previous = start;
            for (int step = 1; step < subdivisions_; ++step) {
                const float t = static_cast<float>(step) / static_cast<float>(subdivisions_);
                const Point next = cubic_point(start, command.control_a, command.control_b, command.point, t);
                emit(previous, next);
                previous = next;
            }
            emit(previous, command.point);
        }
        pen_ = command.point;
    }

    void operator()(const ClosePath&) {
        if (segments_.empty()) {
            return;
        }
        const Point target = segments_.front().start;
        // Zero-length closing segments are dropped.
        if (distance(pen_, target) > 0.0f) {
            emit(pen_, target);
        }
        pen_ = target;
    }

    std::vector<Segment> take() { return std::move(segments_); }

private:
    void emit(const Point& start, const Point& end) {
        segments_.push_back(Segment{start, end, distance(start, end)});
    }

    int subdivisions_ = 1;
    Point pen_{};
    std::vector<Segment> segments_;
};

} // namespace

PathSampler::PathSampler(const Path& commands, const SamplerOptions& options)
    : curve_(build(commands, options)) {}

SampledCurve PathSampler::build(const Path& commands, const SamplerOptions& options) {
    SegmentCollector collector(options);
    for (const PathCommand& command : commands) {
        std::visit(collector, command);
    }

    SampledCurve curve;
    curve.segments_ = collector.take();
    curve.fallback_ = path_origin(commands);
    curve.cumulative_.reserve(curve.segments_.size());

    // Prefix sums in path order; the last entry is bit-identical to total_length_.
    float total = 0.0f;
    for (const Segment& segment : curve.segments_) {
        total += segment.length;
        curve.cumulative_.push_back(total);
    }
    curve.total_length_ = total;
    curve.degenerate_ = curve.segments_.empty() || !std::isfinite(total) || total <= 0.0f;
    return curve;
}

Point PathSampler::point_at(const SampledCurve& curve, float t) {
    if (curve.degenerate_) {
        return curve.fallback_;
    }

    const float clamped = std::isfinite(t) ? std::clamp(t, 0.0f, 1.0f) : 0.0f;
    if (clamped >= 1.0f) {
        return curve.segments_.back().end;
    }
    const float target = clamped * curve.total_length_;

    // First segment whose end reaches the target, same pick as a linear walk.
    const auto it = std::lower_bound(curve.cumulative_.begin(), curve.cumulative_.end(), target);
    if (it == curve.cumulative_.end()) {
        return curve.segments_.back().end;
    }

    const auto index = static_cast<std::size_t>(it - curve.cumulative_.begin());
    const Segment& segment = curve.segments_[index];
    if (segment.length <= 0.0f) {
        return segment.start;
    }

    const float accumulated = index == 0 ? 0.0f : curve.cumulative_[index - 1];
    const float local_t = std::clamp((target - accumulated) / segment.length, 0.0f, 1.0f);
    return lerp(segment.start, segment.end, local_t);
}

} // namespace geometry
} // namespace pulsetrace
