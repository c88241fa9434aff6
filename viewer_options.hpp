#pragma once
#include "bloch_animator.hpp"
#include "bloch_log.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace bloch {

struct ViewerOptions {
    AnimationConfig animation;
    std::size_t trajectory_points = 100;
    Logger::Level log_level = Logger::Level::Info;
    std::string log_file;
    bool show_help = false;
};

// nullopt on an unknown flag or a bad value (already logged)
std::optional<ViewerOptions> parse_viewer_args(int argc, const char* const* argv);

const char* viewer_usage();

}
