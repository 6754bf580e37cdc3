#include "braille_canvas.h"

#include <algorithm>
#include <cmath>

namespace pulsetrace {
namespace renderer {

namespace {
constexpr std::uint8_t kBrailleMask[BrailleCanvas::kDotsPerCellY][BrailleCanvas::kDotsPerCellX] = {
    {0x01u, 0x08u},
    {0x02u, 0x10u},
    {0x04u, 0x20u},
    {0x40u, 0x80u},
};
constexpr float kMinRadius = 0.5f;
}

Rgb rgb_from_hex(std::uint32_t color) {
    return Rgb{static_cast<float>((color >> 16) & 0xFFu) / 255.0f,
               static_cast<float>((color >> 8) & 0xFFu) / 255.0f,
               static_cast<float>(color & 0xFFu) / 255.0f};
}

void BrailleCanvas::resize(int rows, int cols) {
    rows_ = std::max(rows, 0);
    cols_ = std::max(cols, 0);
    const auto cells = static_cast<std::size_t>(rows_) * static_cast<std::size_t>(cols_);
    masks_.assign(cells, 0u);
    accumulation_.assign(cells, Rgb{});
}

void BrailleCanvas::clear() {
    std::fill(masks_.begin(), masks_.end(), std::uint8_t{0});
    std::fill(accumulation_.begin(), accumulation_.end(), Rgb{});
}

bool BrailleCanvas::splat(geometry::Point center, float radius, float intensity, const Rgb& color) {
    if (masks_.empty() || intensity <= 0.0f || std::isnan(radius) || !std::isfinite(center.x) ||
        !std::isfinite(center.y)) {
        return false;
    }

    const int subcols = dot_width();
    const int subrows = dot_height();
    const float r = std::max(radius, kMinRadius);
    if (center.x + r < 0.0f || center.y + r < 0.0f ||
        center.x - r > static_cast<float>(subcols) || center.y - r > static_cast<float>(subrows)) {
        return false;
    }

    // Clamp in float space; the raw bounds may not fit in an int.
    const float max_x = static_cast<float>(subcols - 1);
    const float max_y = static_cast<float>(subrows - 1);
    const int min_subx = static_cast<int>(std::clamp(std::floor(center.x - r), 0.0f, max_x));
    const int max_subx = static_cast<int>(std::clamp(std::ceil(center.x + r), 0.0f, max_x));
    const int min_suby = static_cast<int>(std::clamp(std::floor(center.y - r), 0.0f, max_y));
    const int max_suby = static_cast<int>(std::clamp(std::ceil(center.y + r), 0.0f, max_y));

    bool wrote_sample = false;
    for (int suby = min_suby; suby <= max_suby; ++suby) {
        const float dy = static_cast<float>(suby) - center.y;
        for (int subx = min_subx; subx <= max_subx; ++subx) {
            const float dx = static_cast<float>(subx) - center.x;
            const float dist = std::sqrt(dx * dx + dy * dy);
            if (dist > r) {
                continue;
            }

            const float falloff = 1.0f - std::clamp(dist / r, 0.0f, 1.0f);
            const float sample_intensity = intensity * falloff * falloff;
            if (sample_intensity <= 0.0f) {
                continue;
            }

            const int cell_row = suby / kDotsPerCellY;
            const int cell_col = subx / kDotsPerCellX;
            const std::size_t index =
                static_cast<std::size_t>(cell_row) * static_cast<std::size_t>(cols_) +
                static_cast<std::size_t>(cell_col);

            masks_[index] |= kBrailleMask[suby % kDotsPerCellY][subx % kDotsPerCellX];
            Rgb& accumulated = accumulation_[index];
            accumulated.r += sample_intensity * color.r;
            accumulated.g += sample_intensity * color.g;
            accumulated.b += sample_intensity * color.b;
            wrote_sample = true;
        }
    }
    return wrote_sample;
}

std::uint8_t BrailleCanvas::mask(int row, int col) const {
    if (row < 0 || col < 0 || row >= rows_ || col >= cols_) {
        return 0u;
    }
    return masks_[static_cast<std::size_t>(row) * static_cast<std::size_t>(cols_) + static_cast<std::size_t>(col)];
}

Rgb BrailleCanvas::color(int row, int col) const {
    if (row < 0 || col < 0 || row >= rows_ || col >= cols_) {
        return Rgb{};
    }
    return accumulation_[static_cast<std::size_t>(row) * static_cast<std::size_t>(cols_) + static_cast<std::size_t>(col)];
}

} // namespace renderer
} // namespace pulsetrace
