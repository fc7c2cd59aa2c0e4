#pragma once

#include "parallax/core/math.hpp"
#include <algorithm>
#include <optional>

namespace parallax::filter {

// Exponential moving average. alpha in [0,1]: 1 follows the input exactly,
// 0 freezes. The first update after construction or reset() is taken as-is.
class EmaFilter {
  public:
    explicit EmaFilter(double alpha = 0.5) { setAlpha(alpha); }

    double update(double value) {
        if (!value_) {
            value_ = value;
            return value;
        }
        value_ = alpha_ * value + (1.0 - alpha_) * *value_;
        return *value_;
    }

    void reset() { value_.reset(); }

    void setAlpha(double alpha) { alpha_ = std::clamp(alpha, 0.0, 1.0); }

    double getAlpha() const { return alpha_; }

    std::optional<double> getValue() const { return value_; }

  private:
    double alpha_{0.5};
    std::optional<double> value_;
};

// Three independent channels sharing one alpha.
class Vec3Filter {
  public:
    explicit Vec3Filter(double alpha = 0.5) { setAlpha(alpha); }

    vec3d update(const vec3d &value) {
        return {x_.update(value.x), y_.update(value.y), z_.update(value.z)};
    }

    void reset() {
        x_.reset();
        y_.reset();
        z_.reset();
    }

    void setAlpha(double alpha) {
        x_.setAlpha(alpha);
        y_.setAlpha(alpha);
        z_.setAlpha(alpha);
    }

    double getAlpha() const { return x_.getAlpha(); }

    std::optional<vec3d> getValue() const {
        auto x = x_.getValue();
        auto y = y_.getValue();
        auto z = z_.getValue();
        if (!x || !y || !z)
            return std::nullopt;
        return vec3d{*x, *y, *z};
    }

  private:
    EmaFilter x_;
    EmaFilter y_;
    EmaFilter z_;
};

} // namespace parallax::filter
