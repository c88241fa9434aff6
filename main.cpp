#include <SDL.h>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <string>

#include "bloch_animator.hpp"
#include "bloch_log.hpp"
#include "bloch_math.hpp"
#include "bloch_viz.hpp"
#include "frame_scheduler.hpp"
#include "trajectory.hpp"
#include "viewer_options.hpp"

using namespace bloch;

static ComplexAmplitude random_amplitudes(std::mt19937& rng) {
    std::normal_distribution<double> g(0.0, 1.0);
    ComplexAmplitude amp;
    amp.alpha = Complex{g(rng), g(rng)};
    amp.beta  = Complex{g(rng), g(rng)};
    const double n = std::sqrt(std::norm(amp.alpha) + std::norm(amp.beta));
    if (n > 0.0) { amp.alpha /= n; amp.beta /= n; }
    return amp;
}

static std::string window_title(const std::string& label, const SphericalCoordinates& s, bool animated) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(3)
       << "Bloch sphere  " << label
       << "  theta=" << s.theta << " phi=" << s.phi
       << (animated ? "" : "  [no animation]");
    return os.str();
}

int main(int argc, char** argv) {
    auto parsed = parse_viewer_args(argc, argv);
    if (!parsed) { std::cerr << viewer_usage(); return 2; }
    const ViewerOptions opts = *parsed;
    if (opts.show_help) { std::cout << viewer_usage(); return 0; }

    if (!Logger::init(opts.log_level, opts.log_file))
        Logger::warn("cannot open log file " + opts.log_file + ", logging to stderr");
    if (!viz::sdlm::ensure_sdl()) {
        Logger::error(std::string("SDL_Init failed: ") + SDL_GetError());
        return 1;
    }

    FrameQueue frames;
    BlochAnimator animator(frames, opts.animation);
    TrajectoryHistory history(opts.trajectory_points);
    viz::BlochViewConfig vcfg;

    animator.on_animation_start([] { Logger::debug("transition started"); });
    animator.on_animation_end([&] {
        std::ostringstream os;
        const auto p = probabilities(animator.current());
        os << std::fixed << std::setprecision(4)
           << "settled: p0=" << p.first << " p1=" << p.second;
        Logger::info(os.str());
    });
    animator.on_state_change([&](const SphericalCoordinates& s, const CartesianCoordinates&) {
        history.push(s);
    });

    const auto& states = common_states::all;
    int idx = 0;
    std::string label = states[idx].label;
    animator.set_target(states[idx].coords);

    std::mt19937 rng(std::random_device{}());
    Logger::info(std::string("animation ") + (opts.animation.enabled ? "on" : "off")
                 + ", " + std::to_string((int)opts.animation.duration_ms) + " ms, "
                 + easing_name(opts.animation.easing));

    int rc = 0;
    for (;;) {
        const Uint32 t0 = SDL_GetTicks();

        int jump = 0;
        const auto cmd = viz::poll_command(jump);
        if (cmd == viz::Command::Quit) break;

        const int count = (int)states.size();
        switch (cmd) {
            case viz::Command::Next:
                idx = (idx + 1) % count;
                label = states[idx].label;
                animator.set_target(states[idx].coords);
                break;
            case viz::Command::Prev:
                idx = (idx + count - 1) % count;
                label = states[idx].label;
                animator.set_target(states[idx].coords);
                break;
            case viz::Command::Jump:
                idx = jump;
                label = states[idx].label;
                animator.set_target(states[idx].coords);
                break;
            case viz::Command::Random: {
                const ComplexAmplitude amp = random_amplitudes(rng);
                std::ostringstream os;
                os << std::fixed << std::setprecision(3)
                   << "alpha=" << amp.alpha << " beta=" << amp.beta;
                Logger::info("random state " + os.str());
                label = "random";
                animator.set_target(QuantumState::from_amplitudes(amp));
                break;
            }
            case viz::Command::ToggleAnimation: {
                AnimationConfig cfg = animator.config();
                cfg.enabled = !cfg.enabled;
                animator.set_config(cfg);
                Logger::info(std::string("animation ") + (cfg.enabled ? "on" : "off"));
                break;
            }
            case viz::Command::ClearTrajectory:
                history.clear();
                break;
            default:
                break;
        }

        frames.dispatch((double)SDL_GetTicks());

        const std::string title = window_title(label, animator.current(), animator.config().enabled);
        if (!viz::show_bloch_sphere(animator.current(), history, vcfg, title.c_str())) {
            Logger::error(std::string("rendering failed: ") + SDL_GetError());
            rc = 1;
            break;
        }

        const Uint32 dt = SDL_GetTicks() - t0;
        if ((int)dt < vcfg.min_frame_ms) SDL_Delay(vcfg.min_frame_ms - dt);
    }

    viz::shutdown();
    return rc;
}
