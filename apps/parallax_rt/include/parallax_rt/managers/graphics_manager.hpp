#pragma once

#include "parallax_rt/config/app_config.hpp"
#include "parallax_rt/scene/demo_scene.hpp"
#include <cstdarg>
#include <memory>
#include <optional>
#include <parallax/config/calibration_store.hpp>
#include <parallax/render/render_loop.hpp>
#include <parallax/tracking/head_tracker.hpp>
#include <raylib.h>

namespace parallax_rt::managers {

// Owns the raylib window and acts as the render loop's host: it fires the
// scheduled frame callback once per raylib frame and draws the scene with
// the matrices the loop hands it.
class GraphicsManager : public parallax::render::IFrameScheduler,
                        public parallax::render::IRenderTarget {
  public:
    GraphicsManager(const config::GraphicsSettings &settings,
                    parallax::config::CalibrationStore &calibration,
                    parallax::tracking::HeadTracker &tracker);
    ~GraphicsManager() override;

    GraphicsManager(const GraphicsManager &) = delete;
    GraphicsManager &operator=(const GraphicsManager &) = delete;

    void Init();
    void Run();
    void Shutdown();

    // IFrameScheduler
    parallax::render::FrameHandle requestFrame(Callback callback) override;
    void cancelFrame(parallax::render::FrameHandle handle) override;

    // IRenderTarget
    void applyCamera(
        const parallax::projection::CameraMatrices &matrices) override;
    void draw() override;
    void setViewport(int width, int height) override;

  private:
    struct PendingFrame {
        parallax::render::FrameHandle handle;
        Callback callback;
    };

    void handleInput_();
    void drawHud_() const;
    static void traceLogCallback_(int level, const char *fmt, va_list args);

    config::GraphicsSettings settings_;
    parallax::config::CalibrationStore &calibration_;
    parallax::tracking::HeadTracker &tracker_;
    std::optional<parallax::config::CalibrationStore::ListenerId> listener_;

    std::unique_ptr<parallax::render::RenderLoop> loop_;
    std::optional<PendingFrame> pending_;
    parallax::render::FrameHandle next_handle_{1};

    scene::DemoScene scene_{};
    Matrix view_;
    Matrix projection_;
};

} // namespace parallax_rt::managers
