#pragma once

#include "config/app_config.hpp"
#include "managers/graphics_manager.hpp"
#include "managers/plugin_manager.hpp"
#include "managers/tracking_manager.hpp"
#include <filesystem>
#include <memory>
#include <parallax/config/calibration_store.hpp>
#include <parallax/core/latest_slot.hpp>
#include <parallax/tracking/head_tracker.hpp>

namespace parallax_rt {

class App {
  public:
    explicit App(int argc, char **argv);

    void Launch();

    ~App();

  private:
    void configureLogging_();
    void loadCalibration_();
    void startTracking_();

    std::filesystem::path config_path_{"parallax.json"};
    config::AppConfig config_{};

    parallax::core::LatestSlot<parallax::core::TrackingSample> slot_;
    std::unique_ptr<parallax::config::CalibrationStore> calibration_;
    std::unique_ptr<parallax::tracking::HeadTracker> tracker_;

    std::shared_ptr<managers::PluginManager> pluginManager_;
    std::shared_ptr<managers::TrackingManager> trackingManager_;
    std::shared_ptr<managers::GraphicsManager> graphicsManager_;
};

} // namespace parallax_rt
