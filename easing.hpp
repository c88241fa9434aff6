#pragma once
#include <algorithm>
#include <optional>
#include <string>

namespace bloch {

enum class EasingKind { Linear, EaseIn, EaseOut, EaseInOut };

// f: [0,1] -> [0,1], f(0) = 0, f(1) = 1
inline double apply_easing(EasingKind kind, double t) {
    t = std::clamp(t, 0.0, 1.0);
    switch (kind) {
        case EasingKind::Linear:    return t;
        case EasingKind::EaseIn:    return t * t;
        case EasingKind::EaseOut:   return t * (2.0 - t);
        case EasingKind::EaseInOut: return (t < 0.5) ? 2.0 * t * t : -1.0 + (4.0 - 2.0 * t) * t;
    }
    return t;
}

inline const char* easing_name(EasingKind kind) {
    switch (kind) {
        case EasingKind::Linear:    return "linear";
        case EasingKind::EaseIn:    return "ease-in";
        case EasingKind::EaseOut:   return "ease-out";
        case EasingKind::EaseInOut: return "ease-in-out";
    }
    return "linear";
}

inline std::optional<EasingKind> parse_easing(const std::string& name) {
    if (name == "linear")                             return EasingKind::Linear;
    if (name == "ease-in"     || name == "easeIn")    return EasingKind::EaseIn;
    if (name == "ease-out"    || name == "easeOut")   return EasingKind::EaseOut;
    if (name == "ease-in-out" || name == "easeInOut") return EasingKind::EaseInOut;
    return std::nullopt;
}

}
