#pragma once

#include <array>
#include <raylib.h>

namespace parallax_rt::scene {

struct TunnelSettings {
    float width{8.0f};
    float height{6.0f};
    float depth{20.0f};
    int divisions{8};
    Color color{255, 255, 255, 255};
};

// Wireframe tunnel behind the screen plane plus a few ring targets, in
// meters. The screen plane is z = 0 and the scene extends toward -z.
class DemoScene {
  public:
    explicit DemoScene(TunnelSettings tunnel = {});

    // Must be called between the caller's 3D begin/end.
    void Draw() const;

  private:
    struct Target {
        Vector3 position;
        float radius;
    };

    void drawGrid_(Vector3 origin, Vector3 u, Vector3 v, int div_u,
                   int div_v) const;
    void drawTarget_(const Target &target) const;

    TunnelSettings tunnel_;
    std::array<Target, 5> targets_{};
};

} // namespace parallax_rt::scene
