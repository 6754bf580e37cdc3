#include <algorithm>
#include <chrono>
#include <clocale>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <cxxopts.hpp>
#include <notcurses/notcurses.h>

#include "config.h"
#include "renderer/tracer_renderer.h"
#include "tracer_scene.h"

namespace {

constexpr double kBpmStep = 5.0;

double epoch_seconds() {
    const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::duration<double>>(since_epoch).count();
}

// One line per particle: frame, tracer, particle, x, y, opacity, size, lead.
void run_headless(pulsetrace::TracerScene& scene,
                  double global_bpm,
                  int frames,
                  double fps,
                  double start_s) {
    std::cout << std::fixed << std::setprecision(4);
    for (int frame = 0; frame < frames; ++frame) {
        const double now = start_s + static_cast<double>(frame) / fps;
        for (std::size_t t = 0; t < scene.tracers().size(); ++t) {
            const pulsetrace::Tracer& tracer = scene.tracers()[t];
            const double bpm = pulsetrace::TracerScene::effective_bpm(tracer, global_bpm);
            for (const auto& particle : tracer.animator.frame(bpm, now)) {
                std::cout << frame << ' ' << t << ' ' << particle.index << ' '
                          << particle.point.x << ' ' << particle.point.y << ' '
                          << particle.opacity << ' ' << particle.size << ' '
                          << (particle.is_lead ? 1 : 0) << '\n';
            }
        }
    }
    std::cout.flush();
}

int run_interactive(pulsetrace::TracerScene& scene, const pulsetrace::AppConfig& config, double global_bpm) {
    notcurses_options opts{};
    opts.flags = NCOPTION_SUPPRESS_BANNERS;
    notcurses* nc = notcurses_init(&opts, nullptr);
    if (!nc) {
        std::cerr << "Failed to initialize notcurses" << std::endl;
        return 1;
    }

    int exit_code = 0;
    {
        pulsetrace::renderer::TracerRenderer renderer;
        if (!renderer.init(nc)) {
            std::cerr << "[renderer] failed to create drawing plane" << std::endl;
            notcurses_stop(nc);
            return 1;
        }
        scene.layout(renderer.dot_width(), renderer.dot_height());

        const std::chrono::duration<double> frame_time(1.0 / static_cast<double>(config.visual.target_fps));
        bool running = true;

        while (running) {
            const auto frame_start = std::chrono::steady_clock::now();
            const double now = epoch_seconds();

            renderer.begin_frame();
            for (const pulsetrace::Tracer& tracer : scene.tracers()) {
                const double bpm = pulsetrace::TracerScene::effective_bpm(tracer, global_bpm);
                renderer.draw_trail(tracer.animator.frame(bpm, now), tracer.config.color);
            }
            renderer.end_frame();

            if (config.visual.show_status) {
                std::ostringstream status;
                status << std::fixed << std::setprecision(0) << global_bpm << " bpm  "
                       << scene.tracers().size() << " tracer(s)  [+/-] tempo  [q] quit";
                renderer.draw_status(status.str());
            }

            if (notcurses_render(nc) != 0) {
                std::cerr << "Failed to render frame" << std::endl;
                exit_code = 1;
                break;
            }

            ncinput input{};
            const timespec ts{0, 0};
            uint32_t key = 0;
            while ((key = notcurses_get(nc, &ts, &input)) != 0) {
                if (key == static_cast<uint32_t>(-1) || key == 'q' || key == 'Q') {
                    running = false;
                    break;
                }
                if (key == '+' || key == '=') {
                    global_bpm += kBpmStep;
                } else if (key == '-') {
                    global_bpm = std::max(0.0, global_bpm - kBpmStep);
                } else if (key == NCKEY_RESIZE) {
                    if (renderer.resize(nc)) {
                        scene.layout(renderer.dot_width(), renderer.dot_height());
                    }
                }
            }

            const auto frame_end = std::chrono::steady_clock::now();
            if (frame_end - frame_start < frame_time) {
                std::this_thread::sleep_for(frame_time - (frame_end - frame_start));
            }
        }
    }

    if (notcurses_stop(nc) != 0) {
        std::cerr << "Failed to stop notcurses cleanly" << std::endl;
        return 1;
    }
    return exit_code;
}

} // namespace

int main(int argc, char** argv) {
    std::setlocale(LC_ALL, "");

    cxxopts::Options options("pulsetrace", "Heart-rate synchronised path tracer");
    options.add_options()
        ("c,config", "Path to configuration file", cxxopts::value<std::string>()->default_value("pulsetrace.toml"))
        ("b,bpm", "Heart rate override (beats per minute)", cxxopts::value<double>())
        ("s,shape", "Shape number override (1-9)", cxxopts::value<int>())
        ("n,particles", "Trail particle count override", cxxopts::value<int>())
        ("headless", "Print particle positions instead of drawing")
        ("frames", "Frames to emit in headless mode", cxxopts::value<int>()->default_value("60"))
        ("fps", "Frame rate of headless timestamps", cxxopts::value<double>()->default_value("60"))
        ("start", "First headless timestamp in seconds", cxxopts::value<double>()->default_value("0"))
        ("width", "Headless drawing area width", cxxopts::value<float>()->default_value("100"))
        ("height", "Headless drawing area height", cxxopts::value<float>()->default_value("100"))
        ("h,help", "Print usage");

    cxxopts::ParseResult result;
    try {
        result = options.parse(argc, argv);
    } catch (const cxxopts::exceptions::exception& ex) {
        std::cerr << ex.what() << std::endl;
        std::cerr << options.help() << std::endl;
        return 1;
    }

    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    const std::string config_path = result["config"].as<std::string>();
    const pulsetrace::ConfigLoadResult config_result = pulsetrace::load_app_config(config_path);
    const pulsetrace::AppConfig& config = config_result.config;
    if (!config_result.loaded_file) {
        std::clog << "[config] using built-in defaults (missing '" << config_path << "')" << std::endl;
    } else {
        std::clog << "[config] loaded '" << config_path << "'" << std::endl;
    }
    for (const std::string& warning : config_result.warnings) {
        std::cerr << "[config] " << warning << std::endl;
    }

    std::vector<std::string> scene_warnings;
    pulsetrace::TracerScene scene;
    scene.load(config, scene_warnings);
    for (const std::string& warning : scene_warnings) {
        std::cerr << "[tracer] " << warning << std::endl;
    }

    if (result.count("shape")) {
        scene.set_shape(result["shape"].as<int>());
    }
    if (result.count("particles")) {
        const int particles = result["particles"].as<int>();
        if (particles < 0 || particles > pulsetrace::animation::kMaxParticleCount) {
            std::cerr << "--particles must be between 0 and " << pulsetrace::animation::kMaxParticleCount
                      << std::endl;
            return 1;
        }
        scene.set_particle_count(particles);
    }
    const double global_bpm = result.count("bpm") ? result["bpm"].as<double>() : config.pulse.bpm;

    if (result.count("headless")) {
        const int frames = result["frames"].as<int>();
        const double fps = result["fps"].as<double>();
        if (frames < 0 || !(fps > 0.0)) {
            std::cerr << "--frames must be >= 0 and --fps > 0" << std::endl;
            return 1;
        }
        scene.layout(result["width"].as<float>(), result["height"].as<float>());
        std::clog << "[tracer] headless: " << frames << " frame(s) at " << fps << " fps, "
                  << global_bpm << " bpm" << std::endl;
        run_headless(scene, global_bpm, frames, fps, result["start"].as<double>());
        return 0;
    }

    return run_interactive(scene, config, global_bpm);
}
