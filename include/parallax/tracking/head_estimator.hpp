#pragma once

#include "parallax/core/core.hpp"
#include "parallax/core/utils.hpp"
#include "parallax/tracking/anchor_source.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <optional>

namespace parallax::tracking {

using Clock = std::chrono::steady_clock;

struct EstimatorConfig {
    LandmarkIndices landmarks{};
    // IPD in normalized image units observed at reference_distance_cm
    double reference_ipd{0.1};
    double reference_distance_cm{60.0};
    double camera_fov_deg{60.0};
    double min_depth_cm{30.0};
    double max_depth_cm{150.0};
    // Below this the detection is treated as degenerate
    double min_ipd{1e-4};
    int grace_window_ms{500};
    // A frame gap longer than this reports Holding while still in grace
    int hold_after_ms{150};
    double pointer_range_x_cm{15.0};
    double pointer_range_y_cm{10.0};
    double pointer_depth_step_cm{5.0};
};

// Turns one frame of anchors into an eye position in cm, relative to the
// screen centre. Missing frames re-emit the last valid position for the
// grace window, then report nothing.
class HeadEstimator {
  public:
    explicit HeadEstimator(EstimatorConfig config = {},
                           double baseline_cm = 60.0)
        : config_(config), baseline_cm_(baseline_cm),
          pointer_depth_cm_(clampDepth_(baseline_cm)) {}

    // `frame` may be null when the backend detected nothing.
    std::optional<core::EyePosition> process(const IAnchorSource *frame,
                                             Clock::time_point now) {
        std::optional<core::EyePosition> measured;
        if (frame) {
            measured = mode_ == core::TrackingMode::Pointer
                           ? fromPointer_(*frame)
                           : fromLandmarks_(*frame);
        }

        if (!measured)
            return miss_(now);

        last_valid_ = measured;
        last_valid_time_ = now;
        status_ = core::TrackingStatus::Tracked;
        return measured;
    }

    // Staleness check for ticks that carry no new frame.
    std::optional<core::EyePosition> current(Clock::time_point now) {
        if (last_valid_ && withinGrace_(now)) {
            if (now - last_valid_time_ >=
                std::chrono::milliseconds(config_.hold_after_ms))
                status_ = core::TrackingStatus::Holding;
            return last_valid_;
        }
        last_valid_.reset();
        status_ = core::TrackingStatus::Lost;
        return std::nullopt;
    }

    // The last raw landmark position becomes the neutral pose, which maps to
    // (0, 0, baseline) for whatever the baseline is later. No-op until a
    // landmark frame has been seen.
    bool recenter() {
        if (!last_raw_)
            return false;
        neutral_ = last_raw_;
        return true;
    }

    void clearRecenter() { neutral_.reset(); }

    void setMode(core::TrackingMode mode) {
        if (mode == mode_)
            return;
        mode_ = mode;
        last_valid_.reset();
        status_ = core::TrackingStatus::Lost;
    }

    void setBaseline(double baseline_cm) {
        baseline_cm_ = baseline_cm;
        pointer_depth_cm_ = clampDepth_(baseline_cm);
    }

    // Wheel steps in pointer mode; positive moves the eye away.
    double adjustPointerDepth(int steps) {
        pointer_depth_cm_ = clampDepth_(pointer_depth_cm_ +
                                        steps * config_.pointer_depth_step_cm);
        return pointer_depth_cm_;
    }

    void setConfig(const EstimatorConfig &config) {
        config_ = config;
        pointer_depth_cm_ = clampDepth_(pointer_depth_cm_);
    }

    void reset() {
        last_valid_.reset();
        last_raw_.reset();
        neutral_.reset();
        status_ = core::TrackingStatus::Lost;
        pointer_depth_cm_ = clampDepth_(baseline_cm_);
    }

    core::TrackingMode mode() const { return mode_; }
    core::TrackingStatus status() const { return status_; }
    double baseline() const { return baseline_cm_; }
    double pointerDepth() const { return pointer_depth_cm_; }
    const EstimatorConfig &config() const { return config_; }
    const std::optional<vec3d> &neutralPose() const { return neutral_; }

  private:
    std::optional<core::EyePosition> fromLandmarks_(const IAnchorSource &frame) {
        auto left = frame.anchorPoint(Anchor::LeftEye);
        auto right = frame.anchorPoint(Anchor::RightEye);
        auto nose = frame.anchorPoint(Anchor::NoseTip);
        if (!left || !right || !nose)
            return std::nullopt;

        double ipd = glm::distance(*left, *right);
        if (!std::isfinite(ipd) || ipd < config_.min_ipd)
            return std::nullopt;

        double cx = (left->x + right->x + nose->x) / 3.0;
        double cy = (left->y + right->y + nose->y) / 3.0;
        if (!core::allFinite(cx, cy))
            return std::nullopt;

        double z = clampDepth_(config_.reference_ipd / ipd *
                               config_.reference_distance_cm);
        double visible_width =
            2.0 * z * std::tan(core::deg2rad(config_.camera_fov_deg) / 2.0);

        vec3d raw{(cx - 0.5) * visible_width, (0.5 - cy) * visible_width, z};
        last_raw_ = raw;

        if (!neutral_)
            return core::EyePosition{raw.x, raw.y, raw.z};
        return core::EyePosition{
            raw.x - neutral_->x, raw.y - neutral_->y,
            clampDepth_(raw.z - neutral_->z + baseline_cm_)};
    }

    std::optional<core::EyePosition> fromPointer_(const IAnchorSource &frame) {
        auto p = frame.anchorPoint(Anchor::Pointer);
        if (!p || !core::allFinite(p->x, p->y))
            return std::nullopt;

        double px = std::clamp(p->x, 0.0, 1.0);
        double py = std::clamp(p->y, 0.0, 1.0);
        return core::EyePosition{(px - 0.5) * 2.0 * config_.pointer_range_x_cm,
                                 (0.5 - py) * 2.0 * config_.pointer_range_y_cm,
                                 pointer_depth_cm_};
    }

    std::optional<core::EyePosition> miss_(Clock::time_point now) {
        if (last_valid_ && withinGrace_(now)) {
            status_ = core::TrackingStatus::Holding;
            return last_valid_;
        }
        last_valid_.reset();
        status_ = core::TrackingStatus::Lost;
        return std::nullopt;
    }

    bool withinGrace_(Clock::time_point now) const {
        return now - last_valid_time_ <
               std::chrono::milliseconds(config_.grace_window_ms);
    }

    double clampDepth_(double z) const {
        return std::clamp(z, config_.min_depth_cm, config_.max_depth_cm);
    }

    EstimatorConfig config_;
    core::TrackingMode mode_{core::TrackingMode::Landmarks};
    core::TrackingStatus status_{core::TrackingStatus::Lost};
    double baseline_cm_;
    double pointer_depth_cm_;
    std::optional<vec3d> neutral_;
    std::optional<vec3d> last_raw_;
    std::optional<core::EyePosition> last_valid_;
    Clock::time_point last_valid_time_{};
};

} // namespace parallax::tracking
