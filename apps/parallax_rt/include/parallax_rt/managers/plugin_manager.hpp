#pragma once

#include <expected>
#include <filesystem>
#include <parallax/plugin/loader.hpp>
#include <shared_mutex>
#include <string>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

namespace parallax_rt::managers {

class PluginManager {
  public:
    explicit PluginManager(const std::filesystem::path &plugins_dir);
    ~PluginManager() = default;

    std::error_code LoadPlugin(const std::filesystem::path &path);

    std::expected<parallax::plugin::Plugin, std::error_code>
    GetPlugin(const std::string &name);

    // Names of plugins exposing a tracking source
    std::vector<std::string> GetAvailableSources();

    const std::vector<std::pair<std::string, std::error_code>> &
    GetLoadErrors() const;

    std::error_code UnloadPlugin(const std::string &name);

  private:
    std::unordered_map<std::string, parallax::plugin::Plugin> plugins_;
    mutable std::shared_mutex plugins_mutex_;
    std::vector<std::pair<std::string, std::error_code>> load_errors_;

    void LoadPluginsFromDirectory_(const std::filesystem::path &dir);
    static bool IsPluginLibrary_(const std::filesystem::path &file);
};

} // namespace parallax_rt::managers
