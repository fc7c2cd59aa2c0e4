#pragma once

#include "parallax/core/core.hpp"
#include "parallax/core/latest_slot.hpp"
#include "parallax/filter/ema_filter.hpp"
#include "parallax/tracking/anchor_source.hpp"
#include "parallax/tracking/head_estimator.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace parallax::tracking {

// Shapes the landmark estimate before smoothing. Pointer input is used as is.
struct ResponseConfig {
    double strength{1.0};
    double lateral_gain{0.6};
    // Set when the camera image is already mirrored (selfie view)
    bool mirrored{false};
    double depth_gain{0.3};
};

struct TrackerConfig {
    EstimatorConfig estimator{};
    double filter_alpha{0.7};
    ResponseConfig response{};
};

struct IEyePositionProvider {
    // Called once per render tick.
    virtual core::EyePosition poll(Clock::time_point now) = 0;
    virtual ~IEyePositionProvider() = default;
};

// Per-tick tracking pipeline: latest sample -> estimator -> response
// shaping -> EMA. While nothing is tracked the filter eases back to the
// neutral pose (0, 0, baseline).
class HeadTracker : public IEyePositionProvider {
  public:
    HeadTracker(core::LatestSlot<core::TrackingSample> &slot,
                TrackerConfig config = {}, double baseline_cm = 60.0)
        : slot_(slot), config_(config),
          estimator_(config.estimator, baseline_cm),
          filter_(config.filter_alpha) {}

    core::EyePosition poll(Clock::time_point now) override {
        auto sample = slot_.take();

        std::optional<core::EyePosition> estimate;
        if (estimator_.mode() == core::TrackingMode::Pointer) {
            PointerAnchors anchors(pointer_);
            estimate = estimator_.process(&anchors, now);
        } else if (sample) {
            if (sample->face_present && !sample->landmarks.empty()) {
                LandmarkAnchors anchors(sample->landmarks,
                                        config_.estimator.landmarks);
                estimate = estimator_.process(&anchors, now);
            } else {
                estimate = estimator_.process(nullptr, now);
            }
        } else {
            estimate = estimator_.current(now);
        }

        logTransition_();

        vec3d target = neutral_();
        if (estimate) {
            target = {estimate->x, estimate->y, estimate->z};
            if (estimator_.mode() == core::TrackingMode::Landmarks)
                target = shape_(target);
        }

        vec3d smoothed = filter_.update(target);
        eye_ = {smoothed.x, smoothed.y, smoothed.z};
        return eye_;
    }

    // Normalized window coordinates, y down.
    void setPointer(vec2d pointer) { pointer_ = pointer; }

    void setMode(core::TrackingMode mode) {
        if (mode == estimator_.mode())
            return;
        estimator_.setMode(mode);
        filter_.reset();
        spdlog::info("Tracking mode: {}", core::toString(mode));
    }

    void toggleMode() {
        setMode(estimator_.mode() == core::TrackingMode::Pointer
                    ? core::TrackingMode::Landmarks
                    : core::TrackingMode::Pointer);
    }

    bool recenter() {
        bool ok = estimator_.recenter();
        if (ok)
            spdlog::info("Recentered on current head pose");
        else
            spdlog::debug("Recenter ignored: no head pose yet");
        return ok;
    }

    void clearRecenter() { estimator_.clearRecenter(); }

    void setBaseline(double baseline_cm) { estimator_.setBaseline(baseline_cm); }

    double adjustPointerDepth(int steps) {
        return estimator_.adjustPointerDepth(steps);
    }

    void setSmoothing(double alpha) {
        filter_.setAlpha(alpha);
        config_.filter_alpha = filter_.getAlpha();
    }

    void setStrength(double strength) {
        config_.response.strength = std::max(0.0, strength);
    }

    void reset() {
        estimator_.reset();
        filter_.reset();
        logged_status_ = core::TrackingStatus::Lost;
    }

    core::TrackingMode mode() const { return estimator_.mode(); }
    core::TrackingStatus status() const { return estimator_.status(); }
    const core::EyePosition &eye() const { return eye_; }
    const HeadEstimator &estimator() const { return estimator_; }
    const TrackerConfig &config() const { return config_; }

  private:
    vec3d neutral_() const { return {0.0, 0.0, estimator_.baseline()}; }

    vec3d shape_(const vec3d &p) const {
        const auto &r = config_.response;
        const auto &e = config_.estimator;
        double sign = r.mirrored ? 1.0 : -1.0;
        double base = estimator_.baseline();
        return {r.strength * r.lateral_gain * sign * p.x,
                r.strength * r.lateral_gain * p.y,
                std::clamp(base + (p.z - base) * r.depth_gain, e.min_depth_cm,
                           e.max_depth_cm)};
    }

    void logTransition_() {
        auto status = estimator_.status();
        if (status == logged_status_)
            return;
        spdlog::info("Tracking {} -> {}", core::toString(logged_status_),
                     core::toString(status));
        logged_status_ = status;
    }

    core::LatestSlot<core::TrackingSample> &slot_;
    TrackerConfig config_;
    HeadEstimator estimator_;
    filter::Vec3Filter filter_;
    vec2d pointer_{0.5, 0.5};
    core::EyePosition eye_{};
    core::TrackingStatus logged_status_{core::TrackingStatus::Lost};
};

} // namespace parallax::tracking
