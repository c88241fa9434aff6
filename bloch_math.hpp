#pragma once
#include "bloch_common.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace bloch {

constexpr double SLERP_EPSILON = 1e-4;

// Into [0, 2pi).
inline double wrap_phase(double angle) {
    angle = std::fmod(angle, TWO_PI);
    if (angle < 0.0) angle += TWO_PI;
    // a tiny negative angle rounds up to exactly 2pi
    if (angle >= TWO_PI) angle = 0.0;
    return angle;
}

inline double dot(const CartesianCoordinates& a, const CartesianCoordinates& b) {
    return a.x * b.x + a.y * b.y + a.z * b.z;
}

inline double norm(const CartesianCoordinates& v) {
    return std::sqrt(dot(v, v));
}

// Zero vector maps to |0>; the state need not be normalized.
inline SphericalCoordinates amplitudes_to_spherical(const ComplexAmplitude& amp) {
    const double alpha_mag = std::abs(amp.alpha);
    const double beta_mag  = std::abs(amp.beta);
    const double n = std::sqrt(alpha_mag * alpha_mag + beta_mag * beta_mag);
    if (n == 0.0) return SphericalCoordinates{0.0, 0.0};

    const double theta = 2.0 * std::acos(std::clamp(alpha_mag / n, 0.0, 1.0));
    const double phi   = wrap_phase(std::arg(amp.beta) - std::arg(amp.alpha));
    return SphericalCoordinates{theta, phi};
}

// Global phase fixed so that alpha is real.
inline ComplexAmplitude spherical_to_amplitudes(const SphericalCoordinates& c) {
    const double cos_half = std::cos(c.theta / 2.0);
    const double sin_half = std::sin(c.theta / 2.0);
    ComplexAmplitude amp;
    amp.alpha = Complex{cos_half, 0.0};
    amp.beta  = Complex{sin_half * std::cos(c.phi), sin_half * std::sin(c.phi)};
    return amp;
}

// Z: |0> at z=1. X: |+> at x=1. Y: |+i> at y=1.
inline CartesianCoordinates spherical_to_cartesian(const SphericalCoordinates& c) {
    const double s = std::sin(c.theta);
    return CartesianCoordinates{s * std::cos(c.phi), s * std::sin(c.phi), std::cos(c.theta)};
}

inline SphericalCoordinates cartesian_to_spherical(const CartesianCoordinates& v) {
    const double r = norm(v);
    if (r == 0.0) return SphericalCoordinates{0.0, 0.0};

    const double theta = std::acos(std::clamp(v.z / r, -1.0, 1.0));
    double phi = std::atan2(v.y, v.x);
    if (phi < 0.0) phi += TWO_PI;
    // a tiny negative angle rounds up to exactly 2pi
    if (phi >= TWO_PI) phi = 0.0;
    return SphericalCoordinates{theta, phi};
}

inline SphericalCoordinates to_spherical(const QuantumState& state) {
    if (state.kind == QuantumState::Kind::Amplitudes)
        return amplitudes_to_spherical(state.amplitudes);
    return state.coords;
}

// {P(|0>), P(|1>)}
inline std::pair<double, double> probabilities(const SphericalCoordinates& c) {
    const double cos_half = std::cos(c.theta / 2.0);
    const double p0 = cos_half * cos_half;
    return {p0, 1.0 - p0};
}

// Shortest great-circle arc from start to end. t is clamped to [0, 1].
inline SphericalCoordinates slerp(const SphericalCoordinates& start,
                                  const SphericalCoordinates& end, double t)
{
    if (t <= 0.0) return start;
    if (t >= 1.0) return end;

    const CartesianCoordinates a = spherical_to_cartesian(start);
    const CartesianCoordinates b = spherical_to_cartesian(end);
    const double omega = std::acos(std::clamp(dot(a, b), -1.0, 1.0));

    // Near-coincident or antipodal: sin(omega) ~ 0, interpolate the angles
    // directly, phi along its shorter way round.
    if (omega < SLERP_EPSILON || omega > PI - SLERP_EPSILON) {
        double dphi = end.phi - start.phi;
        if (dphi > PI)  dphi -= TWO_PI;
        if (dphi < -PI) dphi += TWO_PI;
        return SphericalCoordinates{
                start.theta + t * (end.theta - start.theta),
                wrap_phase(start.phi + t * dphi)
        };
    }

    const double sin_omega = std::sin(omega);
    const double wa = std::sin((1.0 - t) * omega) / sin_omega;
    const double wb = std::sin(t * omega) / sin_omega;
    return cartesian_to_spherical(CartesianCoordinates{
            wa * a.x + wb * b.x,
            wa * a.y + wb * b.y,
            wa * a.z + wb * b.z
    });
}

inline bool in_transition(const SphericalCoordinates& target,
                          const SphericalCoordinates& current, double threshold = 0.001)
{
    return std::abs(target.theta - current.theta) > threshold
        || std::abs(target.phi - current.phi) > threshold;
}

}
