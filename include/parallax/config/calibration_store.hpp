#pragma once

#include "parallax/core/core.hpp"
#include <cmath>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <fstream>
#include <functional>
#include <glaze/glaze.hpp>
#include <iterator>
#include <map>
#include <spdlog/spdlog.h>
#include <string>
#include <system_error>

namespace parallax::config {

// Owns the one CalibrationParams value of the process. Every mutation is
// validated; accepted values are persisted and pushed to subscribers
// synchronously, on the caller's thread.
class CalibrationStore {
  public:
    using Listener = std::function<void(const core::CalibrationParams &)>;
    using ListenerId = std::size_t;

    explicit CalibrationStore(std::filesystem::path path = {})
        : path_(std::move(path)) {}

    static std::error_code validate(const core::CalibrationParams &p) {
        auto positive = [](double v) { return std::isfinite(v) && v > 0.0; };
        if (!positive(p.screen_width_cm) || !positive(p.screen_height_cm) ||
            !positive(p.viewer_distance_cm) || !positive(p.near) ||
            !std::isfinite(p.far) || p.far <= p.near)
            return std::make_error_code(std::errc::invalid_argument);
        return {};
    }

    // Reads the file at path(). On any failure the current value is kept.
    std::expected<core::CalibrationParams, std::error_code> load() {
        std::ifstream file(path_);
        if (!file)
            return std::unexpected(
                std::make_error_code(std::errc::no_such_file_or_directory));

        std::string buffer{std::istreambuf_iterator<char>(file),
                           std::istreambuf_iterator<char>()};
        core::CalibrationParams loaded{};
        if (auto ec = glz::read_json(loaded, buffer)) {
            spdlog::warn("Failed to parse calibration \"{}\": {}",
                         path_.string(), glz::format_error(ec, buffer));
            return std::unexpected(
                std::make_error_code(std::errc::bad_message));
        }
        if (auto ec = validate(loaded))
            return std::unexpected(ec);

        apply_(loaded);
        return params_;
    }

    std::error_code save() const {
        if (path_.empty())
            return {};

        std::string buffer;
        if (auto ec = glz::write_json(params_, buffer)) {
            spdlog::error("Failed to serialize calibration: {}",
                          glz::format_error(ec));
            return std::make_error_code(std::errc::bad_message);
        }

        std::ofstream file(path_, std::ios::trunc);
        if (!file)
            return std::make_error_code(std::errc::io_error);
        file << buffer;
        if (!file)
            return std::make_error_code(std::errc::io_error);
        return {};
    }

    std::error_code set(const core::CalibrationParams &params) {
        if (auto ec = validate(params)) {
            spdlog::warn("Rejected calibration: width {} cm, height {} cm, "
                         "distance {} cm, near {} m, far {} m",
                         params.screen_width_cm, params.screen_height_cm,
                         params.viewer_distance_cm, params.near, params.far);
            return ec;
        }
        if (params == params_)
            return {};

        apply_(params);
        persist_();
        return {};
    }

    // Edits a copy of the current value and submits it through set().
    std::error_code modify(
        const std::function<void(core::CalibrationParams &)> &edit) {
        core::CalibrationParams next = params_;
        edit(next);
        return set(next);
    }

    void reset() {
        spdlog::info("Calibration reset to defaults");
        apply_(core::CalibrationParams{});
        persist_();
    }

    ListenerId subscribe(Listener listener) {
        ListenerId id = next_id_++;
        listeners_.emplace(id, std::move(listener));
        return id;
    }

    void unsubscribe(ListenerId id) { listeners_.erase(id); }

    const core::CalibrationParams &get() const { return params_; }
    const std::filesystem::path &path() const { return path_; }

  private:
    void apply_(const core::CalibrationParams &params) {
        params_ = params;
        spdlog::debug("Calibration: {}x{} cm at {} cm, clip {}..{} m",
                      params_.screen_width_cm, params_.screen_height_cm,
                      params_.viewer_distance_cm, params_.near, params_.far);
        for (const auto &[id, listener] : listeners_)
            listener(params_);
    }

    void persist_() {
        if (auto ec = save())
            spdlog::warn("Failed to save calibration to \"{}\": {}",
                         path_.string(), ec.message());
    }

    std::filesystem::path path_;
    core::CalibrationParams params_{};
    std::map<ListenerId, Listener> listeners_;
    ListenerId next_id_{0};
};

} // namespace parallax::config
