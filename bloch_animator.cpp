#include "bloch_animator.hpp"
#include "bloch_log.hpp"
#include "bloch_math.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace bloch {

namespace {
    bool debug_enabled() { return Logger::level() == Logger::Level::Debug; }

    std::string describe(const SphericalCoordinates& c) {
        std::ostringstream os;
        os << std::fixed << std::setprecision(4) << "(theta=" << c.theta << ", phi=" << c.phi << ")";
        return os.str();
    }
}

BlochAnimator::BlochAnimator(IFrameScheduler& scheduler, AnimationConfig cfg)
        : scheduler_(scheduler), cfg_(cfg) {}

BlochAnimator::~BlochAnimator() {
    cancel_tick();
}

CartesianCoordinates BlochAnimator::current_cartesian() const {
    return spherical_to_cartesian(current_);
}

void BlochAnimator::set_target(const ComplexAmplitude& target) {
    set_target(amplitudes_to_spherical(target));
}

void BlochAnimator::set_target(const QuantumState& target) {
    set_target(to_spherical(target));
}

void BlochAnimator::set_target(const SphericalCoordinates& target) {
    // the first state is shown as-is
    if (!has_state_) {
        has_state_ = true;
        target_ = target;
        current_ = target;
        if (debug_enabled()) Logger::debug("initial state " + describe(target));
        publish();
        return;
    }
    if (target == target_) return;

    target_ = target;
    if (!cfg_.enabled) {
        snap_to_target();
        return;
    }
    start_animation();
}

void BlochAnimator::set_config(const AnimationConfig& cfg) {
    cfg_ = cfg;
    if (!cfg_.enabled && animating_) snap_to_target();
}

void BlochAnimator::start_animation() {
    const bool superseding = animating_;
    cancel_tick();

    start_ = current_;
    duration_ms_ = cfg_.duration_ms;
    easing_ = cfg_.easing;
    has_start_time_ = false;
    animating_ = true;
    const unsigned gen = ++generation_;

    if (debug_enabled()) {
        Logger::debug(std::string(superseding ? "animation superseded " : "animation start ")
                      + describe(start_) + " -> " + describe(target_)
                      + " over " + std::to_string(duration_ms_) + " ms, " + easing_name(easing_));
    }

    if (on_start_) on_start_();
    // the start callback may already have retargeted us
    if (gen != generation_ || !animating_) return;
    schedule_tick();
}

void BlochAnimator::snap_to_target() {
    cancel_tick();
    animating_ = false;
    ++generation_;
    current_ = target_;
    publish();
}

void BlochAnimator::cancel_tick() {
    if (pending_tick_ != 0) {
        scheduler_.cancel_frame(pending_tick_);
        pending_tick_ = 0;
    }
}

void BlochAnimator::schedule_tick() {
    pending_tick_ = scheduler_.request_frame([this](double ts) { tick(ts); });
}

void BlochAnimator::tick(double timestamp_ms) {
    pending_tick_ = 0;
    if (!animating_) return;

    if (!has_start_time_) {
        has_start_time_ = true;
        start_time_ms_ = timestamp_ms;
    }

    const double elapsed = timestamp_ms - start_time_ms_;
    const double progress = (duration_ms_ > 0.0) ? std::clamp(elapsed / duration_ms_, 0.0, 1.0) : 1.0;
    current_ = slerp(start_, target_, apply_easing(easing_, progress));

    const unsigned gen = generation_;
    publish();
    if (gen != generation_) return;

    if (progress < 1.0) {
        schedule_tick();
        return;
    }
    animating_ = false;
    if (debug_enabled()) Logger::debug("animation end " + describe(target_));
    if (on_end_) on_end_();
}

void BlochAnimator::publish() {
    if (has_notified_ && last_notified_ == current_) return;
    has_notified_ = true;
    last_notified_ = current_;
    if (on_change_) on_change_(current_, spherical_to_cartesian(current_));
}

}
