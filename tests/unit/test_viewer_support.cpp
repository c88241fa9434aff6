#include "../framework/SimpleTest.hpp"
#include "bloch_animator.hpp"
#include "bloch_log.hpp"
#include "frame_scheduler.hpp"
#include "trajectory.hpp"
#include "viewer_options.hpp"
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

using namespace bloch;

namespace {

const char* const kLogPath = "bloch_logger_test.log";

std::vector<std::string> read_lines(const char* path) {
    std::vector<std::string> lines;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

bool any_contains(const std::vector<std::string>& lines, const std::string& needle) {
    for (const auto& l : lines)
        if (l.find(needle) != std::string::npos) return true;
    return false;
}

}

TEST_CASE(test_trajectory_keeps_most_recent) {
    TrajectoryHistory h(3);
    for (int i = 0; i < 5; ++i) h.push(SphericalCoordinates{0.1 * i, 0.0});
    ASSERT_EQ(h.size(), 3u);
    ASSERT_NEAR(h.points().front().theta, 0.2, 1e-12);
    ASSERT_NEAR(h.points().back().theta, 0.4, 1e-12);
}

TEST_CASE(test_trajectory_zero_capacity_records_nothing) {
    TrajectoryHistory h(0);
    h.push(common_states::plus);
    ASSERT_TRUE(h.empty());
}

TEST_CASE(test_trajectory_shrink_and_clear) {
    TrajectoryHistory h;
    ASSERT_EQ(h.max_points(), 100u);
    for (int i = 0; i < 10; ++i) h.push(SphericalCoordinates{0.1 * i, 0.0});
    h.set_max_points(4);
    ASSERT_EQ(h.size(), 4u);
    ASSERT_NEAR(h.points().front().theta, 0.6, 1e-12);
    h.clear();
    ASSERT_TRUE(h.empty());
}

TEST_CASE(test_trajectory_cartesian_points) {
    TrajectoryHistory h(10);
    h.push(common_states::zero);
    h.push(common_states::plus);
    auto pts = h.cartesian_points();
    ASSERT_EQ(pts.size(), 2u);
    ASSERT_NEAR(pts[0].z, 1.0, 1e-12);
    ASSERT_NEAR(pts[1].x, 1.0, 1e-12);
}

TEST_CASE(test_trajectory_fed_by_animator) {
    FrameQueue q;
    AnimationConfig cfg;
    cfg.easing = EasingKind::Linear;
    BlochAnimator anim(q, cfg);
    TrajectoryHistory h(100);
    anim.on_state_change([&](const SphericalCoordinates& s, const CartesianCoordinates&) { h.push(s); });

    anim.set_target(common_states::zero);
    anim.set_target(common_states::plus);
    for (int ms = 0; ms <= 300; ms += 30) q.dispatch(ms);

    ASSERT_EQ(h.size(), 11u);
    ASSERT_TRUE(h.points().front() == common_states::zero);
    ASSERT_TRUE(h.points().back() == common_states::plus);
}

TEST_CASE(test_options_defaults) {
    const char* argv[] = {"bloch_viewer"};
    auto opts = parse_viewer_args(1, argv);
    ASSERT_TRUE(opts.has_value());
    ASSERT_TRUE(opts->animation.enabled);
    ASSERT_EQ(opts->animation.duration_ms, 300.0);
    ASSERT_TRUE(opts->animation.easing == EasingKind::EaseInOut);
    ASSERT_EQ(opts->trajectory_points, 100u);
    ASSERT_TRUE(opts->log_level == Logger::Level::Info);
    ASSERT_FALSE(opts->show_help);
}

TEST_CASE(test_options_all_flags) {
    const char* argv[] = {"bloch_viewer", "--no-animation", "--duration", "750", "--easing", "ease-out",
                          "--trajectory", "20", "--verbose", "--log-file", "/tmp/bloch.log"};
    auto opts = parse_viewer_args(11, argv);
    ASSERT_TRUE(opts.has_value());
    ASSERT_FALSE(opts->animation.enabled);
    ASSERT_EQ(opts->animation.duration_ms, 750.0);
    ASSERT_TRUE(opts->animation.easing == EasingKind::EaseOut);
    ASSERT_EQ(opts->trajectory_points, 20u);
    ASSERT_TRUE(opts->log_level == Logger::Level::Debug);
    ASSERT_EQ(opts->log_file, std::string("/tmp/bloch.log"));
}

TEST_CASE(test_options_rejects_bad_input) {
    Logger::set_level(Logger::Level::Error);
    const char* unknown[] = {"bloch_viewer", "--fast"};
    ASSERT_FALSE(parse_viewer_args(2, unknown).has_value());

    const char* bad_duration[] = {"bloch_viewer", "--duration", "abc"};
    ASSERT_FALSE(parse_viewer_args(3, bad_duration).has_value());

    const char* negative[] = {"bloch_viewer", "--duration", "-5"};
    ASSERT_FALSE(parse_viewer_args(3, negative).has_value());

    const char* missing[] = {"bloch_viewer", "--easing"};
    ASSERT_FALSE(parse_viewer_args(2, missing).has_value());

    const char* bad_easing[] = {"bloch_viewer", "--easing", "bounce"};
    ASSERT_FALSE(parse_viewer_args(3, bad_easing).has_value());

    const char* bad_points[] = {"bloch_viewer", "--trajectory", "-1"};
    ASSERT_FALSE(parse_viewer_args(3, bad_points).has_value());
    Logger::set_level(Logger::Level::Info);
}

TEST_CASE(test_options_help) {
    const char* argv[] = {"bloch_viewer", "--help"};
    auto opts = parse_viewer_args(2, argv);
    ASSERT_TRUE(opts.has_value());
    ASSERT_TRUE(opts->show_help);
    ASSERT_TRUE(std::string(viewer_usage()).find("--easing") != std::string::npos);
}

TEST_CASE(test_logger_level_filter) {
    Logger::set_level(Logger::Level::Warn);
    ASSERT_TRUE(Logger::level() == Logger::Level::Warn);
    Logger::debug("dropped");
    Logger::set_level(Logger::Level::Info);
    ASSERT_TRUE(Logger::level() == Logger::Level::Info);
}

TEST_CASE(test_logger_writes_file_with_timestamp_and_level) {
    ASSERT_TRUE(Logger::init(Logger::Level::Debug, kLogPath));
    Logger::info("hello");
    Logger::debug("details");
    // back to stderr, which closes the file
    ASSERT_TRUE(Logger::init(Logger::Level::Info));

    const auto lines = read_lines(kLogPath);
    std::remove(kLogPath);
    ASSERT_EQ(lines.size(), 2u);
    for (const auto& l : lines) {
        ASSERT_TRUE(l.size() > 11);
        ASSERT_EQ(l[0], '[');
        ASSERT_EQ(l[3], ':');
        ASSERT_EQ(l[6], ':');
        ASSERT_EQ(l[9], ']');
        ASSERT_EQ(l[10], ' ');
    }
    ASSERT_EQ(lines[0].substr(11), std::string("[INFO]  hello"));
    ASSERT_EQ(lines[1].substr(11), std::string("[DEBUG] details"));
}

TEST_CASE(test_logger_unwritable_path_falls_back) {
    ASSERT_FALSE(Logger::init(Logger::Level::Warn, "no-such-dir/sub/bloch.log"));
    // the level still applies and logging goes to stderr
    ASSERT_TRUE(Logger::level() == Logger::Level::Warn);
    Logger::warn("cannot open log file no-such-dir/sub/bloch.log, logging to stderr");
    ASSERT_TRUE(Logger::init(Logger::Level::Info));
}

TEST_CASE(test_animator_debug_logging_follows_level) {
    auto run = [] {
        FrameQueue q;
        BlochAnimator anim(q);
        anim.set_target(common_states::zero);
        anim.set_target(common_states::plus);
        q.dispatch(0.0);
        q.dispatch(1000.0);
    };

    ASSERT_TRUE(Logger::init(Logger::Level::Debug, kLogPath));
    run();
    ASSERT_TRUE(Logger::init(Logger::Level::Info));
    auto lines = read_lines(kLogPath);
    ASSERT_TRUE(any_contains(lines, "[DEBUG] initial state"));
    ASSERT_TRUE(any_contains(lines, "[DEBUG] animation start"));
    ASSERT_TRUE(any_contains(lines, "[DEBUG] animation end"));

    ASSERT_TRUE(Logger::init(Logger::Level::Info, kLogPath));
    run();
    ASSERT_TRUE(Logger::init(Logger::Level::Info));
    lines = read_lines(kLogPath);
    std::remove(kLogPath);
    ASSERT_TRUE(lines.empty());
}

int main() {
    return bloch::test::TestRunner::instance().run_all("TRAJECTORY AND OPTIONS");
}
