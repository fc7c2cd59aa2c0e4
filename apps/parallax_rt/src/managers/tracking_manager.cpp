#include "parallax_rt/managers/tracking_manager.hpp"
#include <chrono>
#include <spdlog/spdlog.h>
#include <thread>
#include <utility>

namespace parallax_rt::managers {

TrackingManager::TrackingManager(
    parallax::core::LatestSlot<parallax::core::TrackingSample> &slot)
    : slot_(slot) {}

TrackingManager::~TrackingManager() { Stop(); }

std::error_code TrackingManager::SetSource(parallax::plugin::Plugin plugin,
                                           const std::string &config) {
    auto *source = plugin.as<parallax::plugin::ITrackingSource>();
    if (!source) {
        spdlog::error("Plugin \"{}\" is not a tracking source",
                      plugin.getName());
        return std::make_error_code(std::errc::invalid_argument);
    }

    Stop();

    if (auto *configurable = plugin.as<parallax::plugin::IConfigurable>()) {
        if (!configurable->setConfigStr(config.c_str()))
            spdlog::warn("Invalid configuration for \"{}\", using defaults",
                         plugin.getName());
    }

    std::lock_guard<std::mutex> lock(source_mutex_);
    plugin_ = std::move(plugin);
    source_ = source;
    return {};
}

void TrackingManager::SetSource(parallax::plugin::ITrackingSource *source) {
    Stop();
    std::lock_guard<std::mutex> lock(source_mutex_);
    plugin_ = {};
    source_ = source;
}

void TrackingManager::Start() {
    if (tracking_.load(std::memory_order_acquire))
        return;
    {
        std::lock_guard<std::mutex> lock(source_mutex_);
        if (plugin_) {
            spdlog::info("Initializing tracking source \"{}\"",
                         plugin_.getName());
            plugin_->init();
        }
    }
    slot_.reopen();
    tracking_.store(true, std::memory_order_release);
    Spawn();
    spdlog::info("Tracking started");
}

void TrackingManager::Stop() {
    if (!tracking_.exchange(false, std::memory_order_acq_rel))
        return;
    {
        std::lock_guard<std::mutex> lock(source_mutex_);
        if (source_)
            source_->cancel();
    }
    Thread::Stop();
    slot_.close();
    {
        // Releases the capture device or socket held by the source
        std::lock_guard<std::mutex> lock(source_mutex_);
        if (plugin_)
            plugin_->shutdown();
    }
    spdlog::info("Tracking stopped after {} sample(s)", SampleCount());
}

bool TrackingManager::IsTracking() const {
    return tracking_.load(std::memory_order_acquire);
}

uint64_t TrackingManager::SampleCount() const {
    return samples_.load(std::memory_order_relaxed);
}

void TrackingManager::Init() { samples_.store(0, std::memory_order_relaxed); }

void TrackingManager::Run() {
    parallax::plugin::ITrackingSource *source = nullptr;
    {
        std::lock_guard<std::mutex> lock(source_mutex_);
        source = source_;
    }
    if (!source) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        return;
    }

    parallax::core::TrackingSample sample{};
    if (!source->waitForData(sample, get_stop_token())) {
        if (!get_stop_token().stop_requested())
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        return;
    }

    if (slot_.publish(std::move(sample)))
        samples_.fetch_add(1, std::memory_order_relaxed);
}

void TrackingManager::Shutdown() {}

} // namespace parallax_rt::managers
