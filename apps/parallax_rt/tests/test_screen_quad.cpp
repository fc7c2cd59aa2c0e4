#include <cassert>
#include <iostream>
#include <parallax/projection/screen_quad.hpp>

using namespace parallax;

int main() {
    std::cout << "=== Testing screen quad ===" << std::endl;

    {
        auto quad = projection::buildScreenQuad(60.0, 34.0);
        assert(quad.pa == (vec3d{-0.3, -0.17, 0.0}));
        assert(quad.pb == (vec3d{0.3, -0.17, 0.0}));
        assert(quad.pc == (vec3d{-0.3, 0.17, 0.0}));
        assert((quad.pb + quad.pc) * 0.5 == (vec3d{0.0, 0.0, 0.0}));

        auto n = glm::cross(quad.pb - quad.pa, quad.pc - quad.pa);
        assert(glm::length(n) > 0.0 && "Corners must not be collinear");
        std::cout << "  ✓ corners centred on the origin, in meters"
                  << std::endl;
    }

    {
        projection::ScreenQuadCache cache;
        core::CalibrationParams calibration{.screen_width_cm = 60.0,
                                            .screen_height_cm = 34.0};

        const auto &first = cache.get(calibration);
        const auto *address = &first;
        auto copy = first;
        assert(cache.generation() == 1);

        const auto &second = cache.get(calibration);
        assert(&second == address && "Unchanged size returns the cached quad");
        assert(second == copy);
        assert(cache.generation() == 1);

        calibration.viewer_distance_cm = 80.0;
        calibration.near = 0.05;
        calibration.far = 50.0;
        cache.get(calibration);
        assert(cache.generation() == 1 && "Only width and height matter");

        calibration.screen_width_cm = 52.0;
        const auto &wider = cache.get(calibration);
        assert(cache.generation() == 2);
        assert(!(wider == copy));
        assert(wider.pa.x == -0.26);

        calibration.screen_height_cm = 29.0;
        const auto &taller = cache.get(calibration);
        assert(cache.generation() == 3);
        assert(taller.pc.y == 0.145);

        cache.invalidate();
        cache.get(calibration);
        assert(cache.generation() == 4);
        std::cout << "  ✓ cache keyed on width and height" << std::endl;
    }

    std::cout << "\nAll screen quad tests passed" << std::endl;
    return 0;
}
