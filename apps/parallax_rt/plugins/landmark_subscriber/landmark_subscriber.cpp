#include <chrono>
#include <cstdint>
#include <format>
#include <parallax/plugin/interfaces.hpp>
#include <parallax/plugin/loader.hpp>
#include <parallax_rt/net/subscribe_socket.hpp>
#include <parallax_rt/net/tracking_wire.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <thread>

namespace parallax::plugin::landmark_subscriber {

struct Configuration {
    std::string address{"ipc:///tmp/parallax-landmarks.sock"};
    int receive_timeout_ms{100};
};

// Receives JSON face-landmark results from an external landmarker process
// over an nng SUB socket.
class LandmarkSubscriber : public SourcePluginBase<Configuration> {
  public:
    LandmarkSubscriber() = default;
    ~LandmarkSubscriber() = default;

  protected:
    void onInit() override {
        const auto &c = getConfig();
        std::error_code ec{};

        ec = socket_.Init();
        if (ec)
            throw std::runtime_error(std::format(
                "Failed to initialize landmark socket: {}", ec.message()));

        ec = socket_.Subscribe();
        if (!ec)
            ec = socket_.SetReceiveTimeout(
                std::chrono::milliseconds(c.receive_timeout_ms));
        if (!ec)
            ec = socket_.Connect(c.address);
        if (ec) {
            socket_.Shutdown();
            throw std::runtime_error(std::format(
                "Failed to connect to \"{}\": {}", c.address, ec.message()));
        }

        received_ = 0;
        dropped_ = 0;
        spdlog::info("Landmark subscriber connected to {}", c.address);
    }

    void onShutdown() override {
        socket_.Shutdown();
        spdlog::info("Landmark subscriber closed ({} received, {} dropped)",
                     received_, dropped_);
    }

    void onReset() override {
        received_ = 0;
        dropped_ = 0;
    }

    bool onProduce(core::TrackingSample &out, std::stop_token stoken) override {
        if (stoken.stop_requested())
            return false;

        if (auto ec = socket_.Receive(buffer_)) {
            if (parallax_rt::net::detail::is_timeout(ec)) {
                // A silent landmarker reads as no face, so the estimator
                // holds and then loses the last position.
                out.timestamp = nowMicros_();
                out.face_present = false;
                out.landmarks.clear();
                return true;
            }
            spdlog::warn("Landmark receive failed: {}", ec.message());
            std::this_thread::sleep_for(
                std::chrono::milliseconds(getConfig().receive_timeout_ms));
            return false;
        }

        auto sample = parallax_rt::net::DecodeTrackingSample(buffer_);
        if (!sample) {
            ++dropped_;
            spdlog::warn("Dropping malformed landmark message: {}",
                         sample.error());
            return false;
        }

        ++received_;
        out = std::move(sample.value());
        return true;
    }

  private:
    static uint64_t nowMicros_() {
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::steady_clock::now().time_since_epoch())
                .count());
    }

    parallax_rt::net::SubscribeSocket socket_;
    std::string buffer_;
    uint64_t received_{0};
    uint64_t dropped_{0};
};

} // namespace parallax::plugin::landmark_subscriber

PARALLAX_PLUGIN_ENTRY(
    parallax::plugin::landmark_subscriber::LandmarkSubscriber,
    "Landmark Subscriber", "Face landmarks from an external landmarker (nng)",
    parallax::plugin::make_version(1, 0, 0))
