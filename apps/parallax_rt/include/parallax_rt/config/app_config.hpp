#pragma once

#include <parallax/tracking/head_tracker.hpp>
#include <expected>
#include <filesystem>
#include <string>
#include <system_error>

namespace parallax_rt::config {

struct GraphicsSettings {
    int monitor_index{0};
    int width{1280};
    int height{830};
    bool full_screen{false};
    bool vsync{true};
    bool anti_aliasing{true};
    int target_fps{60};
};

struct AppConfig {
    std::string log_level{"info"};
    GraphicsSettings graphics{};
    std::string plugin_directory{"build/plugins"};
    std::string source{"Synthetic Source"};
    // Handed verbatim to the source plugin's setConfigStr
    std::string source_config{};
    std::string calibration_path{"calibration.json"};
    parallax::tracking::TrackerConfig tracking{};
};

// A missing file yields defaults. A file that does not parse is an error.
std::expected<AppConfig, std::error_code>
LoadAppConfig(const std::filesystem::path &path);

// Checks the values glaze cannot: ranges and log level names.
std::error_code ValidateAppConfig(const AppConfig &config);

} // namespace parallax_rt::config
