#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <notcurses/notcurses.h>

#include "animation/trail_animator.h"
#include "braille_canvas.h"

namespace pulsetrace {
namespace renderer {

// Draws comet trails onto a full-screen notcurses plane using braille dots.
class TracerRenderer {
public:
    TracerRenderer() = default;
    ~TracerRenderer();

    TracerRenderer(const TracerRenderer&) = delete;
    TracerRenderer& operator=(const TracerRenderer&) = delete;

    bool init(notcurses* nc);
    // Returns true when the plane changed size.
    bool resize(notcurses* nc);

    // Drawing area in dot units, the coordinate space tracers are laid out in.
    float dot_width() const { return static_cast<float>(canvas_.dot_width()); }
    float dot_height() const { return static_cast<float>(canvas_.dot_height()); }

    void begin_frame();
    void draw_trail(const std::vector<animation::TrailParticle>& particles, std::uint32_t color);
    void end_frame();
    void draw_status(const std::string& text);

private:
    void destroy_plane();

    ncplane* plane_ = nullptr;
    unsigned int plane_rows_ = 0;
    unsigned int plane_cols_ = 0;
    BrailleCanvas canvas_;
};

} // namespace renderer
} // namespace pulsetrace
