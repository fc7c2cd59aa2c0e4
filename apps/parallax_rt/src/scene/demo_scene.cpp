#include "parallax_rt/scene/demo_scene.hpp"
#include <raymath.h>

namespace parallax_rt::scene {

namespace {
constexpr int kRingCount = 5;
constexpr float kTargetRadius = 0.5f;
constexpr float kTargetNear = 4.0f;
constexpr float kTargetFar = 12.0f;
constexpr float kTargetSpread = 1.2f;

// Fixed layout so every run looks the same
constexpr float kTargetOffsets[5][2] = {
    {0.0f, 0.0f}, {0.8f, 0.5f}, {-0.7f, -0.4f}, {0.4f, -0.6f}, {-0.5f, 0.7f},
};
} // namespace

DemoScene::DemoScene(TunnelSettings tunnel) : tunnel_(tunnel) {
    float step = (kTargetFar - kTargetNear) /
                 static_cast<float>(targets_.size() - 1);
    for (std::size_t i = 0; i < targets_.size(); ++i) {
        targets_[i] = {
            .position = {kTargetOffsets[i][0] * kTargetSpread,
                         kTargetOffsets[i][1] * kTargetSpread,
                         -(kTargetNear + step * static_cast<float>(i))},
            .radius = kTargetRadius,
        };
    }
}

void DemoScene::Draw() const {
    const float hw = tunnel_.width / 2.0f;
    const float hh = tunnel_.height / 2.0f;
    const float d = tunnel_.depth;
    const int n = tunnel_.divisions;

    // Floor, ceiling, left, right, back
    drawGrid_({-hw, -hh, 0.0f}, {tunnel_.width, 0.0f, 0.0f}, {0.0f, 0.0f, -d},
              n, n);
    drawGrid_({-hw, hh, 0.0f}, {tunnel_.width, 0.0f, 0.0f}, {0.0f, 0.0f, -d},
              n, n);
    drawGrid_({-hw, -hh, 0.0f}, {0.0f, 0.0f, -d}, {0.0f, tunnel_.height, 0.0f},
              n, n);
    drawGrid_({hw, -hh, 0.0f}, {0.0f, 0.0f, -d}, {0.0f, tunnel_.height, 0.0f},
              n, n);
    drawGrid_({-hw, -hh, -d}, {tunnel_.width, 0.0f, 0.0f},
              {0.0f, tunnel_.height, 0.0f}, n, n);

    // Far to near so nearer targets win at equal depth
    for (auto it = targets_.rbegin(); it != targets_.rend(); ++it)
        drawTarget_(*it);
}

void DemoScene::drawGrid_(Vector3 origin, Vector3 u, Vector3 v, int div_u,
                          int div_v) const {
    for (int i = 0; i <= div_u; ++i) {
        Vector3 a = Vector3Add(
            origin, Vector3Scale(u, static_cast<float>(i) / div_u));
        DrawLine3D(a, Vector3Add(a, v), tunnel_.color);
    }
    for (int j = 0; j <= div_v; ++j) {
        Vector3 a = Vector3Add(
            origin, Vector3Scale(v, static_cast<float>(j) / div_v));
        DrawLine3D(a, Vector3Add(a, u), tunnel_.color);
    }
}

void DemoScene::drawTarget_(const Target &target) const {
    // Stacked discs in the xy plane, inner discs slightly nearer the viewer
    float ring = target.radius / kRingCount;
    for (int i = kRingCount; i >= 1; --i) {
        float back = 0.001f * static_cast<float>(kRingCount - i);
        Color color = (i % 2 == 0) ? RED : WHITE;
        DrawCylinderEx(Vector3Add(target.position, {0.0f, 0.0f, back}),
                       Vector3Add(target.position, {0.0f, 0.0f, back + 0.001f}),
                       ring * i, ring * i, 48, color);
    }
    DrawCircle3D(target.position, target.radius, {1.0f, 0.0f, 0.0f}, 0.0f,
                 DARKGRAY);
}

} // namespace parallax_rt::scene
