#include "parallax_rt/managers/graphics_manager.hpp"
#include "parallax_rt/utils/utils.hpp"
#include <format>
#include <raymath.h>
#include <rlgl.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

namespace parallax_rt::managers {

namespace {

// raylib declares Matrix fields row by row (m0 m4 m8 m12 is the first row),
// glm indexes column first.
Matrix toRaylib(const parallax::mat4d &a) {
    auto f = [&](glm::length_t r, glm::length_t c) {
        return static_cast<float>(a[c][r]);
    };
    return {
        f(0, 0), f(0, 1), f(0, 2), f(0, 3), f(1, 0), f(1, 1), f(1, 2), f(1, 3),
        f(2, 0), f(2, 1), f(2, 2), f(2, 3), f(3, 0), f(3, 1), f(3, 2), f(3, 3),
    };
}

constexpr double kDistanceStepCm = 1.0;

} // namespace

GraphicsManager::GraphicsManager(
    const config::GraphicsSettings &settings,
    parallax::config::CalibrationStore &calibration,
    parallax::tracking::HeadTracker &tracker)
    : settings_(settings), calibration_(calibration), tracker_(tracker),
      view_(MatrixIdentity()), projection_(MatrixIdentity()) {}

GraphicsManager::~GraphicsManager() { Shutdown(); }

void GraphicsManager::traceLogCallback_(int level, const char *fmt,
                                        va_list args) {
    auto message = utils::vprintf_to_string(fmt, args);
    switch (level) {
    case LOG_TRACE:
        spdlog::trace("raylib: {}", message);
        break;
    case LOG_DEBUG:
        spdlog::debug("raylib: {}", message);
        break;
    case LOG_INFO:
        spdlog::info("raylib: {}", message);
        break;
    case LOG_WARNING:
        spdlog::warn("raylib: {}", message);
        break;
    case LOG_ERROR:
    case LOG_FATAL:
        spdlog::error("raylib: {}", message);
        break;
    default:
        break;
    }
}

void GraphicsManager::Init() {
    SetTraceLogCallback(&GraphicsManager::traceLogCallback_);
    SetTraceLogLevel(LOG_INFO);

    unsigned int flags = FLAG_WINDOW_RESIZABLE;
    if (settings_.anti_aliasing)
        flags |= FLAG_MSAA_4X_HINT;
    if (settings_.vsync)
        flags |= FLAG_VSYNC_HINT;
    SetConfigFlags(flags);

    InitWindow(settings_.width, settings_.height, "Parallax");
    if (!IsWindowReady())
        throw std::runtime_error("Failed to create window");

    if (settings_.monitor_index >= 0 &&
        settings_.monitor_index < GetMonitorCount())
        SetWindowMonitor(settings_.monitor_index);
    if (settings_.full_screen && !IsWindowFullscreen())
        ToggleFullscreen();
    SetTargetFPS(settings_.target_fps);
    SetExitKey(KEY_ESCAPE);

    loop_ = std::make_unique<parallax::render::RenderLoop>(
        *this, *this, tracker_, calibration_.get());
    loop_->resize(GetScreenWidth(), GetScreenHeight());

    listener_ = calibration_.subscribe(
        [this](const parallax::core::CalibrationParams &params) {
            loop_->setCalibration(params);
            tracker_.setBaseline(params.viewer_distance_cm);
        });
    tracker_.setBaseline(calibration_.get().viewer_distance_cm);

    loop_->start();
}

void GraphicsManager::Run() {
    if (!loop_)
        throw std::runtime_error("GraphicsManager::Run called before Init");

    while (!WindowShouldClose()) {
        handleInput_();
        if (IsWindowResized())
            loop_->resize(GetScreenWidth(), GetScreenHeight());

        BeginDrawing();
        ClearBackground(BLACK);
        if (pending_) {
            auto frame = std::move(*pending_);
            pending_.reset();
            frame.callback();
        } else {
            // Loop stopped; keep showing the last camera
            draw();
        }
        drawHud_();
        EndDrawing();
    }
    spdlog::info("Exited main loop");
}

void GraphicsManager::Shutdown() {
    if (loop_) {
        loop_->stop();
        loop_.reset();
    }
    if (listener_) {
        calibration_.unsubscribe(*listener_);
        listener_.reset();
    }
    if (IsWindowReady()) {
        spdlog::info("Closing window");
        CloseWindow();
    }
}

parallax::render::FrameHandle
GraphicsManager::requestFrame(Callback callback) {
    auto handle = next_handle_++;
    pending_ = PendingFrame{handle, std::move(callback)};
    return handle;
}

void GraphicsManager::cancelFrame(parallax::render::FrameHandle handle) {
    if (pending_ && pending_->handle == handle)
        pending_.reset();
}

void GraphicsManager::applyCamera(
    const parallax::projection::CameraMatrices &matrices) {
    view_ = toRaylib(matrices.view);
    projection_ = toRaylib(matrices.projection);
}

// Same state changes as BeginMode3D, with explicit matrices
void GraphicsManager::draw() {
    rlDrawRenderBatchActive();

    rlMatrixMode(RL_PROJECTION);
    rlPushMatrix();
    rlLoadIdentity();
    rlMultMatrixf(MatrixToFloatV(projection_).v);

    rlMatrixMode(RL_MODELVIEW);
    rlLoadIdentity();
    rlMultMatrixf(MatrixToFloatV(view_).v);

    rlEnableDepthTest();
    scene_.Draw();
    EndMode3D();
}

void GraphicsManager::setViewport(int width, int height) {
    spdlog::debug("Viewport {}x{}", width, height);
    rlViewport(0, 0, width, height);
}

void GraphicsManager::handleInput_() {
    using parallax::core::TrackingMode;

    if (IsKeyPressed(KEY_M))
        tracker_.toggleMode();

    if (IsKeyPressed(KEY_R))
        tracker_.recenter();

    if (IsKeyPressed(KEY_C)) {
        calibration_.reset();
        tracker_.recenter();
    }

    if (IsKeyPressed(KEY_UP) || IsKeyPressed(KEY_DOWN)) {
        double step = IsKeyPressed(KEY_UP) ? kDistanceStepCm : -kDistanceStepCm;
        if (auto ec = calibration_.modify(
                [step](parallax::core::CalibrationParams &p) {
                    p.viewer_distance_cm += step;
                }))
            spdlog::warn("Viewer distance unchanged: {}", ec.message());
    }

    if (IsKeyPressed(KEY_SPACE)) {
        if (loop_->state() == parallax::render::LoopState::Running)
            loop_->stop();
        else
            loop_->start();
    }

    if (tracker_.mode() == TrackingMode::Pointer) {
        Vector2 mouse = GetMousePosition();
        int w = GetScreenWidth();
        int h = GetScreenHeight();
        if (w > 0 && h > 0)
            tracker_.setPointer({static_cast<double>(mouse.x) / w,
                                 static_cast<double>(mouse.y) / h});

        float wheel = GetMouseWheelMove();
        if (wheel != 0.0f)
            tracker_.adjustPointerDepth(wheel > 0.0f ? -1 : 1);
    }
}

void GraphicsManager::drawHud_() const {
    const auto &eye = tracker_.eye();
    auto line = std::format(
        "{} FPS | {} | {} | eye ({:.1f}, {:.1f}, {:.1f}) cm | {}",
        GetFPS(), parallax::core::toString(tracker_.status()),
        parallax::core::toString(tracker_.mode()), eye.x, eye.y, eye.z,
        parallax::render::toString(loop_ ? loop_->state()
                                         : parallax::render::LoopState::Idle));
    DrawText(line.c_str(), 10, 10, 20, GREEN);
    DrawText("M mode  R recenter  C reset  Up/Down distance  Space pause", 10,
             GetScreenHeight() - 30, 16, GRAY);
}

} // namespace parallax_rt::managers
