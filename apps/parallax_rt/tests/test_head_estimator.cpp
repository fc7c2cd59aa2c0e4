#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <parallax/tracking/head_estimator.hpp>
#include <vector>

using namespace parallax;
using namespace std::chrono_literals;

namespace {

bool approx(double a, double b, double tol = 1e-3) {
    return std::abs(a - b) <= tol;
}

// 478-point face with the three anchors placed explicitly
std::vector<core::Landmark> makeFace(float cx, float cy, float ipd) {
    std::vector<core::Landmark> lm(478, core::Landmark{cx, cy, 0.f});
    lm[33] = {cx - ipd / 2.f, cy, 0.f};
    lm[263] = {cx + ipd / 2.f, cy, 0.f};
    lm[4] = {cx, cy, 0.f};
    return lm;
}

} // namespace

int main() {
    std::cout << "=== Testing head estimator ===" << std::endl;
    const auto t0 = tracking::Clock::time_point{} + 10s;

    {
        tracking::HeadEstimator est;
        auto face = makeFace(0.5f, 0.5f, 0.1f);
        tracking::LandmarkAnchors anchors(face);
        auto eye = est.process(&anchors, t0);
        assert(eye);
        assert(approx(eye->x, 0.0) && approx(eye->y, 0.0));
        assert(approx(eye->z, 60.0) && "Reference IPD maps to reference distance");
        assert(est.status() == core::TrackingStatus::Tracked);
        std::cout << "  ✓ centred face at reference distance" << std::endl;
    }

    {
        tracking::HeadEstimator est;
        auto face = makeFace(0.6f, 0.4f, 0.1f);
        tracking::LandmarkAnchors anchors(face);
        auto eye = est.process(&anchors, t0);
        assert(eye);
        double visible = 2.0 * 60.0 * std::tan(core::deg2rad(30.0));
        assert(approx(eye->x, 0.1 * visible));
        assert(approx(eye->y, 0.1 * visible) && "Image y down is world y up");
        std::cout << "  ✓ face centre converted to cm" << std::endl;
    }

    {
        tracking::HeadEstimator est;
        auto close = makeFace(0.5f, 0.5f, 0.5f);
        tracking::LandmarkAnchors a(close);
        assert(est.process(&a, t0)->z == 30.0);

        auto far = makeFace(0.5f, 0.5f, 0.01f);
        tracking::LandmarkAnchors b(far);
        assert(est.process(&b, t0)->z == 150.0);
        std::cout << "  ✓ depth clamped to [30, 150]" << std::endl;
    }

    {
        tracking::HeadEstimator est;
        auto zero = makeFace(0.5f, 0.5f, 0.0f);
        tracking::LandmarkAnchors anchors(zero);
        assert(!est.process(&anchors, t0) && "Zero IPD is no detection");

        auto tiny = makeFace(0.5f, 0.5f, 1e-6f);
        tracking::LandmarkAnchors tiny_anchors(tiny);
        assert(!est.process(&tiny_anchors, t0));

        std::vector<core::Landmark> truncated(10);
        tracking::LandmarkAnchors short_anchors(truncated);
        assert(!est.process(&short_anchors, t0) && "Missing anchor indices");
        assert(est.status() == core::TrackingStatus::Lost);
        std::cout << "  ✓ degenerate detections report nothing" << std::endl;
    }

    {
        tracking::HeadEstimator est;
        auto face = makeFace(0.55f, 0.5f, 0.1f);
        tracking::LandmarkAnchors anchors(face);
        auto valid = est.process(&anchors, t0);
        assert(valid);

        auto held = est.process(nullptr, t0 + 300ms);
        assert(held && *held == *valid);
        assert(est.status() == core::TrackingStatus::Holding);

        auto still = est.current(t0 + 499ms);
        assert(still && *still == *valid);

        assert(!est.process(nullptr, t0 + 600ms));
        assert(est.status() == core::TrackingStatus::Lost);
        assert(!est.current(t0 + 650ms));
        std::cout << "  ✓ last position held for 500 ms, then lost"
                  << std::endl;
    }

    {
        // A source that goes silent publishes nothing at all
        tracking::HeadEstimator est;
        auto face = makeFace(0.55f, 0.5f, 0.1f);
        tracking::LandmarkAnchors anchors(face);
        auto valid = est.process(&anchors, t0);
        assert(valid);

        assert(est.current(t0 + 16ms));
        assert(est.status() == core::TrackingStatus::Tracked &&
               "Frame-to-frame gaps stay tracked");

        auto held = est.current(t0 + 200ms);
        assert(held && *held == *valid);
        assert(est.status() == core::TrackingStatus::Holding);

        assert(!est.current(t0 + 600ms));
        assert(est.status() == core::TrackingStatus::Lost);

        assert(est.process(&anchors, t0 + 700ms));
        assert(est.status() == core::TrackingStatus::Tracked);
        std::cout << "  ✓ silent source goes tracked, holding, lost"
                  << std::endl;
    }

    {
        tracking::HeadEstimator est;
        assert(!est.recenter() && "Nothing to recenter on yet");

        est.setBaseline(65.0);
        auto face = makeFace(0.6f, 0.5f, 0.1f);
        tracking::LandmarkAnchors anchors(face);
        auto before = est.process(&anchors, t0);
        assert(before && before->x > 1.0);

        assert(est.recenter());
        auto after = est.process(&anchors, t0 + 10ms);
        assert(after);
        assert(approx(after->x, 0.0) && approx(after->y, 0.0));
        assert(approx(after->z, 65.0) && "Neutral pose maps to the baseline");

        est.setBaseline(80.0);
        auto moved = est.process(&anchors, t0 + 15ms);
        assert(moved && approx(moved->x, 0.0));
        assert(approx(moved->z, 80.0) && "Neutral pose follows the baseline");

        est.clearRecenter();
        assert(!est.neutralPose());
        auto cleared = est.process(&anchors, t0 + 20ms);
        assert(approx(cleared->x, before->x));
        std::cout << "  ✓ recenter offsets the neutral pose" << std::endl;
    }

    {
        tracking::HeadEstimator est({}, 60.0);
        est.setMode(core::TrackingMode::Pointer);

        tracking::PointerAnchors corner({1.0, 0.0});
        auto eye = est.process(&corner, t0);
        assert(eye);
        assert(eye->x == 15.0 && eye->y == 10.0 && eye->z == 60.0);

        tracking::PointerAnchors centre({0.5, 0.5});
        eye = est.process(&centre, t0);
        assert(eye->x == 0.0 && eye->y == 0.0);

        tracking::PointerAnchors outside({-3.0, 7.0});
        eye = est.process(&outside, t0);
        assert(eye->x == -15.0 && eye->y == -10.0);

        assert(est.adjustPointerDepth(1) == 65.0);
        assert(est.adjustPointerDepth(-100) == 30.0);
        assert(est.process(&centre, t0)->z == 30.0);

        auto face = makeFace(0.5f, 0.5f, 0.1f);
        tracking::LandmarkAnchors landmarks(face);
        assert(!est.process(&landmarks, t0 + 1s) &&
               "Pointer mode ignores landmark frames");
        std::cout << "  ✓ pointer mode maps to a fixed range" << std::endl;
    }

    {
        tracking::HeadEstimator est;
        auto face = makeFace(0.5f, 0.5f, 0.1f);
        tracking::LandmarkAnchors anchors(face);
        assert(est.process(&anchors, t0));

        est.setMode(core::TrackingMode::Pointer);
        assert(!est.process(nullptr, t0 + 10ms) &&
               "Mode switch drops the held position");
        std::cout << "  ✓ mode switch starts from nothing" << std::endl;
    }

    std::cout << "\nAll head estimator tests passed" << std::endl;
    return 0;
}
