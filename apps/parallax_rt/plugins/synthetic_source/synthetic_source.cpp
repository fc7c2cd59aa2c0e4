#include <algorithm>
#include <chrono>
#include <cmath>
#include <numbers>
#include <parallax/core/core.hpp>
#include <parallax/plugin/interfaces.hpp>
#include <parallax/plugin/loader.hpp>
#include <parallax/tracking/anchor_source.hpp>
#include <spdlog/spdlog.h>
#include <thread>

namespace parallax::plugin::synthetic_source {

struct Configuration {
    double sample_rate{30.0};
    // Peak horizontal sway of the face centre, normalized image units
    double amplitude{0.15};
    double period_s{6.0};
    // Relative IPD swing; 0.3 moves the face about +-30% in depth
    double depth_swing{0.3};
    double ipd{0.1};
    std::size_t landmark_count{478};
    tracking::LandmarkIndices indices{};
    // 0 disables dropouts
    double dropout_every_s{0.0};
    double dropout_duration_s{0.7};
};

// A face that sways on a sinusoid. Useful without a camera and for
// exercising the face-lost grace window through periodic dropouts.
class SyntheticSource : public SourcePluginBase<Configuration> {
  public:
    SyntheticSource() = default;
    ~SyntheticSource() = default;

  protected:
    void onInit() override {
        const auto &c = getConfig();
        start_ = Clock::now();
        frame_count_ = 0;
        spdlog::info("Synthetic source: {} Hz, {} landmarks, dropouts {}",
                     c.sample_rate, c.landmark_count,
                     c.dropout_every_s > 0.0 ? "on" : "off");
    }
    void onShutdown() override {}
    void onReset() override {
        start_ = Clock::now();
        frame_count_ = 0;
    }

    bool onProduce(core::TrackingSample &out, std::stop_token stoken) override {
        const auto &c = getConfig();
        double rate = c.sample_rate > 0.0 ? c.sample_rate : 30.0;
        std::this_thread::sleep_for(
            std::chrono::microseconds(static_cast<int64_t>(1e6 / rate)));
        if (stoken.stop_requested())
            return false;

        auto now = Clock::now();
        double t = std::chrono::duration<double>(now - start_).count();
        out.timestamp = static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::microseconds>(
                now.time_since_epoch())
                .count());
        ++frame_count_;

        if (inDropout_(t)) {
            out.face_present = false;
            out.landmarks.clear();
            return true;
        }

        constexpr double tau = 2.0 * std::numbers::pi;
        double period = c.period_s > 0.0 ? c.period_s : 6.0;
        double cx = 0.5 + c.amplitude * std::sin(tau * t / period);
        double cy = 0.5 + 0.5 * c.amplitude * std::sin(2.0 * tau * t / period);
        double ipd = c.ipd * (1.0 + c.depth_swing *
                                        std::sin(tau * t / (1.7 * period)));

        std::size_t count = c.landmark_count;
        count = std::max({count, c.indices.left_eye + 1,
                          c.indices.right_eye + 1, c.indices.nose_tip + 1});
        out.landmarks.assign(count, core::Landmark{static_cast<float>(cx),
                                                   static_cast<float>(cy),
                                                   0.0f});

        // Eyes slightly above and the nose below the centre, so the anchor
        // mean is (cx, cy)
        out.landmarks[c.indices.left_eye] = {static_cast<float>(cx - ipd / 2),
                                             static_cast<float>(cy - 0.02),
                                             0.0f};
        out.landmarks[c.indices.right_eye] = {
            static_cast<float>(cx + ipd / 2), static_cast<float>(cy - 0.02),
            0.0f};
        out.landmarks[c.indices.nose_tip] = {static_cast<float>(cx),
                                             static_cast<float>(cy + 0.04),
                                             -0.02f};
        out.face_present = true;
        return true;
    }

  private:
    using Clock = std::chrono::steady_clock;

    bool inDropout_(double t) const {
        const auto &c = getConfig();
        if (c.dropout_every_s <= 0.0)
            return false;
        double phase = std::fmod(t, c.dropout_every_s);
        return phase > c.dropout_every_s - c.dropout_duration_s;
    }

    Clock::time_point start_{};
    uint64_t frame_count_{0};
};

} // namespace parallax::plugin::synthetic_source

PARALLAX_PLUGIN_ENTRY(parallax::plugin::synthetic_source::SyntheticSource,
                      "Synthetic Source",
                      "Sinusoidally swaying synthetic face landmarks",
                      parallax::plugin::make_version(1, 0, 0))
