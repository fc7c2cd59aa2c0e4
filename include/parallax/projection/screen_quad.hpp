#pragma once

#include "parallax/core/core.hpp"
#include "parallax/core/math.hpp"
#include <cstdint>
#include <optional>

namespace parallax::projection {

// Physical screen corners in meters, centred on the world origin in the
// z = 0 plane. pa bottom-left, pb bottom-right, pc top-left.
struct ScreenQuad {
    vec3d pa;
    vec3d pb;
    vec3d pc;

    bool operator==(const ScreenQuad &) const = default;
};

// Width and height must be positive; the calibration store guarantees it.
inline ScreenQuad buildScreenQuad(double width_cm, double height_cm) {
    double hw = width_cm / 100.0 / 2.0;
    double hh = height_cm / 100.0 / 2.0;
    return {
        .pa = {-hw, -hh, 0.0},
        .pb = {hw, -hh, 0.0},
        .pc = {-hw, hh, 0.0},
    };
}

inline ScreenQuad buildScreenQuad(const core::CalibrationParams &calibration) {
    return buildScreenQuad(calibration.screen_width_cm,
                           calibration.screen_height_cm);
}

// Keyed on (width, height). Other calibration fields never invalidate it.
class ScreenQuadCache {
  public:
    const ScreenQuad &get(const core::CalibrationParams &calibration) {
        if (!quad_ || width_cm_ != calibration.screen_width_cm ||
            height_cm_ != calibration.screen_height_cm) {
            width_cm_ = calibration.screen_width_cm;
            height_cm_ = calibration.screen_height_cm;
            quad_ = buildScreenQuad(width_cm_, height_cm_);
            ++generation_;
        }
        return *quad_;
    }

    void invalidate() { quad_.reset(); }

    // Bumped on every rebuild.
    uint64_t generation() const { return generation_; }

  private:
    std::optional<ScreenQuad> quad_;
    double width_cm_{0.0};
    double height_cm_{0.0};
    uint64_t generation_{0};
};

} // namespace parallax::projection
