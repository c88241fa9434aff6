#pragma once
#include "bloch_common.hpp"
#include "bloch_math.hpp"
#include <cstddef>
#include <deque>
#include <vector>

namespace bloch {

// Most recent max_points states observed by the caller. The animator never
// owns one of these; the viewer feeds it from on_state_change.
class TrajectoryHistory {
public:
    explicit TrajectoryHistory(std::size_t max_points = 100) : max_points_(max_points) {}

    void push(const SphericalCoordinates& c) {
        if (max_points_ == 0) return;
        points_.push_back(c);
        while (points_.size() > max_points_) points_.pop_front();
    }

    void clear() { points_.clear(); }

    void set_max_points(std::size_t n) {
        max_points_ = n;
        while (points_.size() > max_points_) points_.pop_front();
    }

    std::size_t max_points() const { return max_points_; }
    std::size_t size() const { return points_.size(); }
    bool empty() const { return points_.empty(); }
    const std::deque<SphericalCoordinates>& points() const { return points_; }

    std::vector<CartesianCoordinates> cartesian_points() const {
        std::vector<CartesianCoordinates> out;
        out.reserve(points_.size());
        for (const auto& p : points_) out.push_back(spherical_to_cartesian(p));
        return out;
    }

private:
    std::size_t max_points_;
    std::deque<SphericalCoordinates> points_;
};

}
