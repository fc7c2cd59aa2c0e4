#pragma once

#include <algorithm>
#include <cmath>
#include <concepts>
#include <cstdint>
#include <numbers>

namespace parallax::core {
// FNV-1a hash
constexpr uint64_t hash_string(const char *str) {
    uint64_t hash = 14695981039346656037ULL;
    while (*str) {
        hash ^= static_cast<uint64_t>(*str++);
        hash *= 1099511628211ULL;
    }
    return hash;
}

template <typename T>
concept DoubleConvertible = std::convertible_to<T, double>;

double deg2rad(const DoubleConvertible auto degrees) {
    return static_cast<double>(degrees) * std::numbers::pi / 180.0;
}

double rad2deg(const DoubleConvertible auto radians) {
    return static_cast<double>(radians) * 180.0 / std::numbers::pi;
}

// Full angle subtended by `size` seen from `distance` (same units), in degrees.
double subtendedAngle(const DoubleConvertible auto size,
                      const DoubleConvertible auto distance) {
    return rad2deg(2.0 * std::atan(static_cast<double>(size) /
                                   (2.0 * static_cast<double>(distance))));
}

inline bool allFinite(std::floating_point auto... values) {
    return (std::isfinite(values) && ...);
}

} // namespace parallax::core
