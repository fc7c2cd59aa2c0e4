#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

namespace parallax::core {

// Viewer eye position in centimeters. x/y relative to the screen centre,
// z along the screen normal (viewer side positive).
struct EyePosition {
    double x{0.0};
    double y{0.0};
    double z{60.0};

    constexpr bool operator==(const EyePosition &) const = default;
};

// Physical display calibration. Lengths in cm, clip planes in meters.
struct CalibrationParams {
    double screen_width_cm{30.4};
    double screen_height_cm{19.7};
    double viewer_distance_cm{60.0};
    double near{0.1};
    double far{200.0};

    constexpr bool operator==(const CalibrationParams &) const = default;
};

// Normalized image coordinates, [0,1] with y growing downward.
struct Landmark {
    float x{0.f};
    float y{0.f};
    float z{0.f};
};

struct TrackingSample {
    uint64_t timestamp{0}; // microseconds
    bool face_present{false};
    std::vector<Landmark> landmarks;
};

enum class TrackingMode : uint8_t {
    Landmarks = 0,
    Pointer,
};

enum class TrackingStatus : uint8_t {
    Tracked = 0,
    Holding,
    Lost,
};

constexpr std::string_view toString(TrackingMode mode) {
    switch (mode) {
    case TrackingMode::Landmarks:
        return "landmarks";
    case TrackingMode::Pointer:
        return "pointer";
    }
    return "unknown";
}

constexpr std::string_view toString(TrackingStatus status) {
    switch (status) {
    case TrackingStatus::Tracked:
        return "TRACKED";
    case TrackingStatus::Holding:
        return "HOLDING";
    case TrackingStatus::Lost:
        return "LOST";
    }
    return "UNKNOWN";
}

} // namespace parallax::core
