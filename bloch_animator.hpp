#pragma once
#include "bloch_common.hpp"
#include "easing.hpp"
#include "frame_scheduler.hpp"
#include <functional>
#include <utility>

namespace bloch {

struct AnimationConfig {
    bool enabled = true;
    double duration_ms = 300.0;
    EasingKind easing = EasingKind::EaseInOut;
};

// Drives the displayed state toward the latest target along a great circle,
// one scheduler tick at a time. A new target supersedes the running
// animation and starts from wherever the state currently is.
class BlochAnimator {
public:
    using EventCallback       = std::function<void()>;
    using StateChangeCallback = std::function<void(const SphericalCoordinates&,
                                                   const CartesianCoordinates&)>;

    explicit BlochAnimator(IFrameScheduler& scheduler, AnimationConfig cfg = {});
    ~BlochAnimator();

    BlochAnimator(const BlochAnimator&) = delete;
    BlochAnimator& operator=(const BlochAnimator&) = delete;

    void set_target(const SphericalCoordinates& target);
    void set_target(const ComplexAmplitude& target);
    void set_target(const QuantumState& target);

    // Duration and easing of a running animation are fixed at its start;
    // disabling animation while one runs snaps to its target.
    void set_config(const AnimationConfig& cfg);
    const AnimationConfig& config() const { return cfg_; }

    const SphericalCoordinates& current() const { return current_; }
    CartesianCoordinates current_cartesian() const;
    const SphericalCoordinates& target() const { return target_; }
    bool is_animating() const { return animating_; }

    void on_animation_start(EventCallback cb)     { on_start_ = std::move(cb); }
    void on_animation_end(EventCallback cb)       { on_end_ = std::move(cb); }
    void on_state_change(StateChangeCallback cb)  { on_change_ = std::move(cb); }

private:
    void start_animation();
    void snap_to_target();
    void cancel_tick();
    void schedule_tick();
    void tick(double timestamp_ms);
    void publish();

    IFrameScheduler& scheduler_;
    AnimationConfig cfg_;

    bool has_state_ = false;
    SphericalCoordinates current_;
    SphericalCoordinates target_;

    bool animating_ = false;
    SphericalCoordinates start_;
    double duration_ms_ = 0.0;
    EasingKind easing_ = EasingKind::EaseInOut;
    bool has_start_time_ = false;
    double start_time_ms_ = 0.0;
    FrameHandle pending_tick_ = 0;
    unsigned generation_ = 0;

    bool has_notified_ = false;
    SphericalCoordinates last_notified_;

    EventCallback on_start_;
    EventCallback on_end_;
    StateChangeCallback on_change_;
};

}
