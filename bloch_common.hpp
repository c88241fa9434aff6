#pragma once
#include <array>
#include <complex>
#include <cmath>

namespace bloch {

using Complex = std::complex<double>;
constexpr double PI     = 3.1415926535897932384626433832795;
constexpr double TWO_PI = 2.0 * PI;

// |psi> = cos(theta/2)|0> + e^(i*phi) sin(theta/2)|1>
struct SphericalCoordinates {
    double theta = 0.0;   // polar angle from +Z, [0, pi]
    double phi   = 0.0;   // azimuth from +X in the XY plane, [0, 2pi)
};

inline bool operator==(const SphericalCoordinates& a, const SphericalCoordinates& b) {
    return a.theta == b.theta && a.phi == b.phi;
}
inline bool operator!=(const SphericalCoordinates& a, const SphericalCoordinates& b) {
    return !(a == b);
}

struct CartesianCoordinates {
    double x = 0.0, y = 0.0, z = 1.0;
};

// |psi> = alpha|0> + beta|1>, not necessarily normalized
struct ComplexAmplitude {
    Complex alpha{1.0, 0.0};
    Complex beta{0.0, 0.0};
};

struct QuantumState {
    enum class Kind { Spherical, Amplitudes };

    Kind kind = Kind::Spherical;
    SphericalCoordinates coords;
    ComplexAmplitude amplitudes;

    static QuantumState spherical(const SphericalCoordinates& c) {
        QuantumState s;
        s.kind = Kind::Spherical;
        s.coords = c;
        return s;
    }
    static QuantumState from_amplitudes(const ComplexAmplitude& a) {
        QuantumState s;
        s.kind = Kind::Amplitudes;
        s.amplitudes = a;
        return s;
    }
};

namespace common_states {
    constexpr SphericalCoordinates zero    {0.0,      0.0};
    constexpr SphericalCoordinates one     {PI,       0.0};
    constexpr SphericalCoordinates plus    {PI / 2.0, 0.0};
    constexpr SphericalCoordinates minus   {PI / 2.0, PI};
    constexpr SphericalCoordinates plus_i  {PI / 2.0, PI / 2.0};
    constexpr SphericalCoordinates minus_i {PI / 2.0, 3.0 * PI / 2.0};

    struct Named {
        const char* label;
        SphericalCoordinates coords;
    };

    // cycle order used by the viewer
    constexpr std::array<Named, 6> all = {{
            {"|0>",  zero},
            {"|+>",  plus},
            {"|+i>", plus_i},
            {"|1>",  one},
            {"|->",  minus},
            {"|-i>", minus_i},
    }};
}

}
