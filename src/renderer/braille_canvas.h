#pragma once

#include <cstdint>
#include <vector>

#include "geometry/point.h"

namespace pulsetrace {
namespace renderer {

struct Rgb {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
};

Rgb rgb_from_hex(std::uint32_t color);

// Braille dot grid: every terminal cell holds 2 columns x 4 rows of dots.
// Splats accumulate colour per cell and set the dots they cover.
class BrailleCanvas {
public:
    static constexpr int kDotsPerCellX = 2;
    static constexpr int kDotsPerCellY = 4;

    void resize(int rows, int cols);
    void clear();

    int rows() const { return rows_; }
    int cols() const { return cols_; }
    int dot_width() const { return cols_ * kDotsPerCellX; }
    int dot_height() const { return rows_ * kDotsPerCellY; }

    // Soft disc centred at `center` (dot coordinates). Returns false when no
    // dot was touched.
    bool splat(geometry::Point center, float radius, float intensity, const Rgb& color);

    std::uint8_t mask(int row, int col) const;
    Rgb color(int row, int col) const;

    static char32_t glyph(std::uint8_t mask) { return static_cast<char32_t>(0x2800u + mask); }

private:
    int rows_ = 0;
    int cols_ = 0;
    std::vector<std::uint8_t> masks_;
    std::vector<Rgb> accumulation_;
};

} // namespace renderer
} // namespace pulsetrace
