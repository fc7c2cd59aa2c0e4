#include "parallax_rt/app.hpp"
#include <format>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace parallax_rt {

App::App(int argc, char **argv) {
    if (argc > 1)
        config_path_ = argv[1];
}

void App::Launch() {
    auto config = config::LoadAppConfig(config_path_);
    if (!config)
        throw std::runtime_error(std::format("Failed to load config \"{}\": {}",
                                             config_path_.string(),
                                             config.error().message()));
    config_ = std::move(config.value());
    configureLogging_();

    loadCalibration_();

    tracker_ = std::make_unique<parallax::tracking::HeadTracker>(
        slot_, config_.tracking, calibration_->get().viewer_distance_cm);

    pluginManager_ =
        std::make_shared<managers::PluginManager>(config_.plugin_directory);
    auto load_errors = pluginManager_->GetLoadErrors();
    if (!load_errors.empty()) {
        spdlog::warn("{} plugin(s) failed to load:", load_errors.size());
        for (const auto &[path, ec] : load_errors)
            spdlog::warn("  - {}: {}", path, ec.message());
    }

    trackingManager_ = std::make_shared<managers::TrackingManager>(slot_);
    graphicsManager_ = std::make_shared<managers::GraphicsManager>(
        config_.graphics, *calibration_, *tracker_);

    startTracking_();
    graphicsManager_->Init();

    graphicsManager_->Run();

    trackingManager_->Stop();
    graphicsManager_->Shutdown();
}

void App::configureLogging_() {
    auto level = spdlog::level::from_str(config_.log_level);
    spdlog::set_level(level);
    spdlog::info("Log level: {}", spdlog::level::to_string_view(level));
}

void App::loadCalibration_() {
    calibration_ = std::make_unique<parallax::config::CalibrationStore>(
        config_.calibration_path);

    auto loaded = calibration_->load();
    if (!loaded) {
        spdlog::warn("Using default calibration ({}): {}",
                     config_.calibration_path, loaded.error().message());
        return;
    }
    spdlog::info("Loaded calibration: {}x{} cm at {} cm",
                 loaded->screen_width_cm, loaded->screen_height_cm,
                 loaded->viewer_distance_cm);
}

void App::startTracking_() {
    auto plugin = pluginManager_->GetPlugin(config_.source);
    if (!plugin) {
        auto available = pluginManager_->GetAvailableSources();
        spdlog::error("Tracking source \"{}\" not found ({} available)",
                      config_.source, available.size());
        for (const auto &name : available)
            spdlog::error("  - {}", name);
        throw std::runtime_error(std::format(
            "Tracking source \"{}\" not found: {}", config_.source,
            plugin.error().message()));
    }

    if (auto ec = trackingManager_->SetSource(std::move(plugin.value()),
                                              config_.source_config))
        throw std::runtime_error(std::format(
            "Cannot use \"{}\" as tracking source: {}", config_.source,
            ec.message()));

    trackingManager_->Start();
}

App::~App() {
    if (trackingManager_)
        trackingManager_->Stop();
}

} // namespace parallax_rt
