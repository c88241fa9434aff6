#include "viewer_options.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace bloch {

namespace {
    bool parse_double(const std::string& s, double& out) {
        if (s.empty()) return false;
        errno = 0;
        char* end = nullptr;
        const double v = std::strtod(s.c_str(), &end);
        if (errno != 0 || *end != '\0' || !std::isfinite(v)) return false;
        out = v;
        return true;
    }

    bool parse_count(const std::string& s, std::size_t& out) {
        if (s.empty() || s[0] == '-') return false;
        errno = 0;
        char* end = nullptr;
        const unsigned long long v = std::strtoull(s.c_str(), &end, 10);
        if (errno != 0 || *end != '\0') return false;
        out = static_cast<std::size_t>(v);
        return true;
    }
}

const char* viewer_usage() {
    return "usage: bloch_viewer [--no-animation] [--duration <ms>] [--easing <name>]\n"
           "                    [--trajectory <points>] [--verbose] [--log-file <path>]\n"
           "easing: linear | ease-in | ease-out | ease-in-out\n"
           "keys: left/right cycle states, 0 1 p m i k jump to |0> |1> |+> |-> |+i> |-i>,\n"
           "      r random state, a toggle animation, c clear trajectory, q quit\n";
}

std::optional<ViewerOptions> parse_viewer_args(int argc, const char* const* argv) {
    ViewerOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&](std::string& out) -> bool {
            if (i + 1 >= argc) {
                Logger::error("missing value for " + arg);
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string v;
        if (arg == "--no-animation") {
            opts.animation.enabled = false;
        } else if (arg == "--duration") {
            if (!value(v)) return std::nullopt;
            double ms = 0.0;
            if (!parse_double(v, ms) || ms < 0.0) {
                Logger::error("bad --duration value: " + v);
                return std::nullopt;
            }
            opts.animation.duration_ms = ms;
        } else if (arg == "--easing") {
            if (!value(v)) return std::nullopt;
            const auto kind = parse_easing(v);
            if (!kind) {
                Logger::error("unknown easing: " + v);
                return std::nullopt;
            }
            opts.animation.easing = *kind;
        } else if (arg == "--trajectory") {
            if (!value(v)) return std::nullopt;
            if (!parse_count(v, opts.trajectory_points)) {
                Logger::error("bad --trajectory value: " + v);
                return std::nullopt;
            }
        } else if (arg == "--verbose") {
            opts.log_level = Logger::Level::Debug;
        } else if (arg == "--log-file") {
            if (!value(opts.log_file)) return std::nullopt;
        } else if (arg == "--help" || arg == "-h") {
            opts.show_help = true;
        } else {
            Logger::error("unknown argument: " + arg);
            return std::nullopt;
        }
    }
    return opts;
}

}
