#include "parallax_rt/config/app_config.hpp"
#include <fstream>
#include <glaze/glaze.hpp>
#include <iterator>
#include <spdlog/spdlog.h>

namespace parallax_rt::config {

std::expected<AppConfig, std::error_code>
LoadAppConfig(const std::filesystem::path &path) {
    AppConfig config{};

    std::ifstream file(path);
    if (!file) {
        spdlog::warn("Config \"{}\" not found, using defaults", path.string());
        return config;
    }

    std::string buffer{std::istreambuf_iterator<char>(file),
                       std::istreambuf_iterator<char>()};
    if (auto ec = glz::read_json(config, buffer)) {
        spdlog::error("Failed to parse config \"{}\": {}", path.string(),
                      glz::format_error(ec, buffer));
        return std::unexpected(std::make_error_code(std::errc::bad_message));
    }

    if (auto ec = ValidateAppConfig(config))
        return std::unexpected(ec);

    return config;
}

std::error_code ValidateAppConfig(const AppConfig &config) {
    auto invalid = [](std::string_view what) {
        spdlog::error("Invalid config: {}", what);
        return std::make_error_code(std::errc::invalid_argument);
    };

    if (spdlog::level::from_str(config.log_level) == spdlog::level::off &&
        config.log_level != "off")
        return invalid("unknown log_level");

    const auto &g = config.graphics;
    if (g.width <= 0 || g.height <= 0)
        return invalid("graphics width and height must be positive");
    if (g.target_fps < 0)
        return invalid("graphics target_fps must not be negative");

    const auto &e = config.tracking.estimator;
    if (e.reference_ipd <= 0.0 || e.reference_distance_cm <= 0.0)
        return invalid("reference IPD and distance must be positive");
    if (e.camera_fov_deg <= 0.0 || e.camera_fov_deg >= 180.0)
        return invalid("camera_fov_deg must be in (0, 180)");
    if (e.min_depth_cm <= 0.0 || e.max_depth_cm < e.min_depth_cm)
        return invalid("depth clamp range is empty");
    if (e.grace_window_ms < 0 || e.hold_after_ms < 0)
        return invalid("grace_window_ms and hold_after_ms must not be negative");
    if (e.min_ipd <= 0.0)
        return invalid("min_ipd must be positive");

    const auto &r = config.tracking.response;
    if (r.strength < 0.0 || r.lateral_gain < 0.0 || r.depth_gain < 0.0)
        return invalid("response gains must not be negative");

    return {};
}

} // namespace parallax_rt::config
