#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <system_error>
#include <mutex>
#include <parallax/core/core.hpp>
#include <parallax/core/latest_slot.hpp>
#include <parallax/core/thread.hpp>
#include <parallax/plugin/loader.hpp>

namespace parallax_rt::managers {

// Pulls samples from the configured tracking source on its own thread and
// overwrites the render tick's slot with each one. Stopping closes the slot,
// so a sample that completes after Stop() is discarded.
class TrackingManager : public parallax::core::Thread<TrackingManager> {
  public:
    explicit TrackingManager(
        parallax::core::LatestSlot<parallax::core::TrackingSample> &slot);
    ~TrackingManager();

    // Takes shared ownership of a loaded plugin and configures it. The
    // plugin is initialized by Start() and shut down by Stop().
    std::error_code SetSource(parallax::plugin::Plugin plugin,
                              const std::string &config);

    // Non-owning; the source must outlive Stop().
    void SetSource(parallax::plugin::ITrackingSource *source);

    void Start();
    void Stop();

    bool IsTracking() const;
    uint64_t SampleCount() const;

    // Thread<T> CRTP interface
    void Init();
    void Run();
    void Shutdown();

  private:
    parallax::core::LatestSlot<parallax::core::TrackingSample> &slot_;
    parallax::plugin::Plugin plugin_;
    parallax::plugin::ITrackingSource *source_{nullptr};
    std::mutex source_mutex_;
    std::atomic<bool> tracking_{false};
    std::atomic<uint64_t> samples_{0};
};

} // namespace parallax_rt::managers
