#pragma once

#include "parallax/core/core.hpp"
#include "parallax/projection/off_axis.hpp"
#include "parallax/projection/screen_quad.hpp"
#include "parallax/tracking/head_tracker.hpp"
#include <cmath>
#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <spdlog/spdlog.h>
#include <string_view>

namespace parallax::render {

enum class LoopState : uint8_t {
    Idle = 0,
    Running,
    Stopped,
};

constexpr std::string_view toString(LoopState state) {
    switch (state) {
    case LoopState::Idle:
        return "IDLE";
    case LoopState::Running:
        return "RUNNING";
    case LoopState::Stopped:
        return "STOPPED";
    }
    return "UNKNOWN";
}

using FrameHandle = uint64_t;

// Host frame pacing. A requested callback fires at most once.
struct IFrameScheduler {
    using Callback = std::function<void()>;
    virtual FrameHandle requestFrame(Callback callback) = 0;
    // Unknown or already fired handles are ignored.
    virtual void cancelFrame(FrameHandle handle) = 0;
    virtual ~IFrameScheduler() = default;
};

struct IRenderTarget {
    virtual void applyCamera(const projection::CameraMatrices &matrices) = 0;
    virtual void draw() = 0;
    virtual void setViewport(int width, int height) = 0;
    virtual ~IRenderTarget() = default;
};

// Drives one tick per scheduled frame: poll the eye, rebuild the off-axis
// camera if the eye or calibration changed, draw, reschedule.
class RenderLoop {
  public:
    RenderLoop(IFrameScheduler &scheduler, IRenderTarget &target,
               tracking::IEyePositionProvider &eyes,
               const core::CalibrationParams &calibration)
        : scheduler_(scheduler), target_(target), eyes_(eyes),
          calibration_(calibration) {}

    RenderLoop(const RenderLoop &) = delete;
    RenderLoop &operator=(const RenderLoop &) = delete;

    ~RenderLoop() { cancel_(); }

    bool start() {
        if (state_ == LoopState::Running)
            return false;
        spdlog::info("Render loop {} -> RUNNING", toString(state_));
        state_ = LoopState::Running;
        schedule_();
        return true;
    }

    bool stop() {
        cancel_();
        if (state_ != LoopState::Running)
            return false;
        spdlog::info("Render loop RUNNING -> STOPPED");
        state_ = LoopState::Stopped;
        return true;
    }

    // Viewport only. The off-axis camera depends on calibration and eye.
    void resize(int width, int height) {
        if (width <= 0 || height <= 0) {
            spdlog::warn("Ignoring resize to {}x{}", width, height);
            return;
        }
        target_.setViewport(width, height);
        viewport_width_ = width;
        viewport_height_ = height;
        checkAspect_();
    }

    void setCalibration(const core::CalibrationParams &calibration) {
        if (calibration == calibration_)
            return;
        calibration_ = calibration;
        dirty_ = true;
        checkAspect_();
    }

    LoopState state() const { return state_; }
    const core::CalibrationParams &calibration() const { return calibration_; }
    const projection::OffAxisCamera &camera() const { return camera_; }
    const projection::ScreenQuadCache &quads() const { return quads_; }
    const core::EyePosition &lastEye() const { return last_eye_; }
    uint64_t frameCount() const { return frames_; }
    uint64_t rebuildCount() const { return rebuilds_; }
    bool hasPendingFrame() const { return pending_.has_value(); }

  private:
    void schedule_() {
        pending_ = scheduler_.requestFrame([this] { tick_(); });
    }

    void cancel_() {
        if (!pending_)
            return;
        scheduler_.cancelFrame(*pending_);
        pending_.reset();
    }

    void tick_() {
        pending_.reset();
        if (state_ != LoopState::Running)
            return;

        try {
            auto eye = eyes_.poll(tracking::Clock::now());
            if (dirty_ || !has_eye_ || eye != last_eye_) {
                const auto &quad = quads_.get(calibration_);
                if (camera_.update(eye, quad, calibration_.near,
                                   calibration_.far))
                    ++rebuilds_;
                last_eye_ = eye;
                has_eye_ = true;
                dirty_ = false;
            }
            if (camera_.valid())
                target_.applyCamera(camera_.matrices());
            target_.draw();
            ++frames_;
        } catch (const std::exception &e) {
            spdlog::error("Render tick failed: {}", e.what());
        }

        // draw() may have stopped the loop
        if (state_ == LoopState::Running && !pending_)
            schedule_();
    }

    void checkAspect_() {
        if (viewport_width_ <= 0 || viewport_height_ <= 0)
            return;
        double screen = calibration_.screen_width_cm /
                        calibration_.screen_height_cm;
        double viewport = static_cast<double>(viewport_width_) /
                          static_cast<double>(viewport_height_);
        if (std::abs(screen - viewport) / screen > 0.02) {
            spdlog::warn("Viewport aspect {:.3f} differs from calibrated "
                         "screen aspect {:.3f}; the image will be distorted",
                         viewport, screen);
        }
    }

    IFrameScheduler &scheduler_;
    IRenderTarget &target_;
    tracking::IEyePositionProvider &eyes_;
    core::CalibrationParams calibration_;

    LoopState state_{LoopState::Idle};
    std::optional<FrameHandle> pending_;
    projection::ScreenQuadCache quads_;
    projection::OffAxisCamera camera_;
    core::EyePosition last_eye_{};
    bool has_eye_{false};
    bool dirty_{true};
    int viewport_width_{0};
    int viewport_height_{0};
    uint64_t frames_{0};
    uint64_t rebuilds_{0};
};

} // namespace parallax::render
