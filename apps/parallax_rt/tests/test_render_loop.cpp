#include <cassert>
#include <iostream>
#include <map>
#include <parallax/render/render_loop.hpp>
#include <stdexcept>
#include <utility>

using namespace parallax;
using render::FrameHandle;
using render::LoopState;

namespace {

class ManualScheduler : public render::IFrameScheduler {
  public:
    FrameHandle requestFrame(Callback callback) override {
        auto handle = next_++;
        pending_.emplace(handle, std::move(callback));
        return handle;
    }

    void cancelFrame(FrameHandle handle) override {
        ++cancels;
        pending_.erase(handle);
    }

    // Fires everything that was pending before the call
    void fire() {
        auto frames = std::move(pending_);
        pending_.clear();
        for (auto &[handle, callback] : frames)
            callback();
    }

    std::size_t pending() const { return pending_.size(); }

    int cancels{0};

  private:
    FrameHandle next_{1};
    std::map<FrameHandle, Callback> pending_;
};

class RecordingTarget : public render::IRenderTarget {
  public:
    void applyCamera(const projection::CameraMatrices &m) override {
        ++applied;
        last = m;
    }
    void draw() override { ++draws; }
    void setViewport(int w, int h) override {
        width = w;
        height = h;
    }

    int applied{0};
    int draws{0};
    int width{0};
    int height{0};
    projection::CameraMatrices last{};
};

class FixedEyes : public tracking::IEyePositionProvider {
  public:
    core::EyePosition poll(tracking::Clock::time_point) override {
        ++polls;
        if (fail)
            throw std::runtime_error("tracker exploded");
        return eye;
    }

    core::EyePosition eye{0.0, 0.0, 65.0};
    bool fail{false};
    int polls{0};
};

const core::CalibrationParams kCalibration{
    .screen_width_cm = 60.0,
    .screen_height_cm = 34.0,
    .viewer_distance_cm = 65.0,
    .near = 0.1,
    .far = 100.0,
};

} // namespace

int main() {
    std::cout << "=== Testing render loop ===" << std::endl;

    ManualScheduler scheduler;
    RecordingTarget target;
    FixedEyes eyes;
    render::RenderLoop loop(scheduler, target, eyes, kCalibration);

    {
        assert(loop.state() == LoopState::Idle);
        assert(scheduler.pending() == 0);
        assert(!loop.stop() && "Nothing to stop while idle");

        assert(loop.start());
        assert(loop.state() == LoopState::Running);
        assert(scheduler.pending() == 1);
        assert(!loop.start() && "Already running");
        assert(scheduler.pending() == 1);
        std::cout << "  ✓ idle -> running schedules one frame" << std::endl;
    }

    {
        scheduler.fire();
        assert(eyes.polls == 1);
        assert(loop.rebuildCount() == 1);
        assert(target.applied == 1 && target.draws == 1);
        assert(scheduler.pending() == 1 && "Tick reschedules itself");
        assert(loop.camera().valid());

        scheduler.fire();
        scheduler.fire();
        assert(loop.frameCount() == 3);
        assert(loop.rebuildCount() == 1 && "Static viewer, no rebuild");
        assert(target.draws == 3);
        std::cout << "  ✓ matrices rebuilt only when inputs change"
                  << std::endl;
    }

    {
        eyes.eye = {15.0, 0.0, 65.0};
        scheduler.fire();
        assert(loop.rebuildCount() == 2);
        assert(target.last.eye.x == 0.15);

        auto calibration = kCalibration;
        loop.setCalibration(calibration);
        scheduler.fire();
        assert(loop.rebuildCount() == 2 && "Identical calibration is a no-op");

        calibration.screen_width_cm = 52.0;
        loop.setCalibration(calibration);
        scheduler.fire();
        assert(loop.rebuildCount() == 3);
        assert(loop.quads().generation() == 2);

        calibration.far = 50.0;
        loop.setCalibration(calibration);
        scheduler.fire();
        assert(loop.rebuildCount() == 4);
        assert(loop.quads().generation() == 2 && "Clip planes keep the quad");
        std::cout << "  ✓ eye and calibration changes trigger a rebuild"
                  << std::endl;
    }

    {
        auto before = loop.camera().matrices();
        int rebuilds = static_cast<int>(loop.rebuildCount());
        loop.resize(1920, 1080);
        assert(target.width == 1920 && target.height == 1080);
        scheduler.fire();
        assert(static_cast<int>(loop.rebuildCount()) == rebuilds);
        assert(loop.camera().matrices().projection == before.projection);

        loop.resize(0, 600);
        assert(target.width == 1920 && "Non-positive sizes are ignored");
        std::cout << "  ✓ resize leaves the projection alone" << std::endl;
    }

    {
        auto before = loop.camera().matrices();
        auto draws = target.draws;
        eyes.eye = {0.0, 0.0, -10.0};
        scheduler.fire();
        assert(loop.camera().skippedCount() == 1);
        assert(loop.camera().matrices().view == before.view);
        assert(target.draws == draws + 1 && "Held matrices are still drawn");
        assert(target.last.view == before.view);
        eyes.eye = {0.0, 0.0, 65.0};
        std::cout << "  ✓ degenerate eye holds and draws" << std::endl;
    }

    {
        auto frames = loop.frameCount();
        eyes.fail = true;
        scheduler.fire();
        assert(loop.frameCount() == frames);
        assert(scheduler.pending() == 1 && "A failed tick still reschedules");
        eyes.fail = false;
        scheduler.fire();
        assert(loop.frameCount() == frames + 1);
        std::cout << "  ✓ exceptions stay inside the tick" << std::endl;
    }

    {
        assert(loop.stop());
        assert(loop.state() == LoopState::Stopped);
        assert(scheduler.pending() == 0 && "Pending frame cancelled");
        assert(scheduler.cancels == 1);

        assert(!loop.stop());
        assert(scheduler.cancels == 1 && "Second stop has nothing to cancel");

        auto frames = loop.frameCount();
        scheduler.fire();
        assert(loop.frameCount() == frames);

        assert(loop.start());
        assert(loop.state() == LoopState::Running);
        scheduler.fire();
        assert(loop.frameCount() == frames + 1);
        std::cout << "  ✓ stop is idempotent and restartable" << std::endl;
    }

    std::cout << "\nAll render loop tests passed" << std::endl;
    return 0;
}
