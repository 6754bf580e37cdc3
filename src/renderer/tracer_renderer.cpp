#include "tracer_renderer.h"

#include <algorithm>

namespace pulsetrace {
namespace renderer {

namespace {
// Particle size is in point units; a 16pt lead covers a disc of ~2.4 dots.
constexpr float kSizeToDotRadius = 0.15f;
constexpr float kCoreRadiusRatio = 0.4f;
constexpr float kCoreIntensity = 0.8f;
constexpr std::uint8_t kBackground = 0u;
constexpr std::uint8_t kStatusForeground = 200u;

int to_channel(float value) {
    return static_cast<int>(std::clamp(value, 0.0f, 1.0f) * 255.0f + 0.5f);
}
}

TracerRenderer::~TracerRenderer() {
    destroy_plane();
}

void TracerRenderer::destroy_plane() {
    if (plane_) {
        ncplane_destroy(plane_);
        plane_ = nullptr;
    }
    plane_rows_ = 0;
    plane_cols_ = 0;
    canvas_.resize(0, 0);
}

bool TracerRenderer::init(notcurses* nc) {
    destroy_plane();
    if (!nc) {
        return false;
    }

    ncplane* stdplane = notcurses_stdplane(nc);
    unsigned int std_rows = 0;
    unsigned int std_cols = 0;
    ncplane_dim_yx(stdplane, &std_rows, &std_cols);

    ncplane_options opts{};
    opts.rows = std_rows;
    opts.cols = std_cols;
    opts.y = 0;
    opts.x = 0;

    plane_ = ncplane_create(stdplane, &opts);
    if (!plane_) {
        return false;
    }
    ncplane_dim_yx(plane_, &plane_rows_, &plane_cols_);
    canvas_.resize(static_cast<int>(plane_rows_), static_cast<int>(plane_cols_));
    return true;
}

bool TracerRenderer::resize(notcurses* nc) {
    if (!nc) {
        return false;
    }
    unsigned int std_rows = 0;
    unsigned int std_cols = 0;
    ncplane_dim_yx(notcurses_stdplane(nc), &std_rows, &std_cols);
    if (plane_ && std_rows == plane_rows_ && std_cols == plane_cols_) {
        return false;
    }
    return init(nc);
}

void TracerRenderer::begin_frame() {
    canvas_.clear();
    if (plane_) {
        ncplane_erase(plane_);
    }
}

void TracerRenderer::draw_trail(const std::vector<animation::TrailParticle>& particles, std::uint32_t color) {
    const Rgb tint = rgb_from_hex(color);
    const Rgb white{1.0f, 1.0f, 1.0f};

    // Tail first so the lead lands on top of its neighbours.
    for (auto it = particles.rbegin(); it != particles.rend(); ++it) {
        const animation::TrailParticle& particle = *it;
        const float radius = particle.size * kSizeToDotRadius;
        canvas_.splat(particle.point, radius, particle.opacity, tint);
        if (particle.is_lead) {
            canvas_.splat(particle.point, radius * kCoreRadiusRatio, particle.opacity * kCoreIntensity, white);
        }
    }
}

void TracerRenderer::end_frame() {
    if (!plane_) {
        return;
    }

    for (int row = 0; row < canvas_.rows(); ++row) {
        for (int col = 0; col < canvas_.cols(); ++col) {
            const std::uint8_t mask = canvas_.mask(row, col);
            if (mask == 0u) {
                continue;
            }

            nccell cell = NCCELL_TRIVIAL_INITIALIZER;
            if (nccell_load_ucs32(plane_, &cell, BrailleCanvas::glyph(mask)) <= 0) {
                continue;
            }
            const Rgb accumulated = canvas_.color(row, col);
            nccell_set_fg_rgb8(&cell, to_channel(accumulated.r), to_channel(accumulated.g), to_channel(accumulated.b));
            nccell_set_bg_rgb8(&cell, kBackground, kBackground, kBackground);
            ncplane_putc_yx(plane_, row, col, &cell);
            nccell_release(plane_, &cell);
        }
    }
}

void TracerRenderer::draw_status(const std::string& text) {
    if (!plane_ || plane_rows_ == 0) {
        return;
    }
    ncplane_set_fg_rgb8(plane_, kStatusForeground, kStatusForeground, kStatusForeground);
    ncplane_set_bg_rgb8(plane_, kBackground, kBackground, kBackground);
    ncplane_putstr_yx(plane_, static_cast<int>(plane_rows_) - 1, 0, text.c_str());
}

} // namespace renderer
} // namespace pulsetrace
