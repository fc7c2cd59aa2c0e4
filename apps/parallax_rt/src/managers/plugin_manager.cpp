#include "parallax_rt/managers/plugin_manager.hpp"
#include <algorithm>
#include <cctype>
#include <dlfcn.h>
#include <spdlog/spdlog.h>

namespace parallax_rt::managers {

PluginManager::PluginManager(const std::filesystem::path &plugins_dir) {
    LoadPluginsFromDirectory_(plugins_dir);
}

std::error_code PluginManager::LoadPlugin(const std::filesystem::path &path) {
    void *handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);

    if (!handle) {
        spdlog::debug("dlopen failed: {}", dlerror());
        return std::make_error_code(std::errc::no_such_file_or_directory);
    }

    auto createPlugin = reinterpret_cast<parallax::plugin::PluginCreateFcn *>(
        dlsym(handle, "createPlugin"));
    auto destroyPlugin =
        reinterpret_cast<parallax::plugin::PluginDestroyFcn *>(
            dlsym(handle, "destroyPlugin"));
    auto getName = reinterpret_cast<parallax::plugin::PluginNameFcn *>(
        dlsym(handle, "pluginName"));
    auto getDescription =
        reinterpret_cast<parallax::plugin::PluginDescriptionFcn *>(
            dlsym(handle, "pluginDescription"));
    auto getVersion = reinterpret_cast<parallax::plugin::PluginVersionFcn *>(
        dlsym(handle, "pluginVersion"));

    if (!createPlugin || !destroyPlugin || !getName) {
        dlclose(handle);
        return std::make_error_code(std::errc::executable_format_error);
    }

    parallax::plugin::PluginInfo info{
        .name = getName(),
        .description = getDescription ? getDescription() : "",
        .version = getVersion ? getVersion() : 0,
    };
    parallax::plugin::Plugin plugin(handle, createPlugin, destroyPlugin,
                                    std::move(info), path);

    if (!plugin) {
        return std::make_error_code(std::errc::executable_format_error);
    }

    {
        std::unique_lock lock(plugins_mutex_);
        if (plugins_.find(plugin.getName()) == plugins_.end()) {
            plugins_.emplace(plugin.getName(), std::move(plugin));
        } else {
            spdlog::warn("Duplicate plugin \"{}\" in {} ignored",
                         plugin.getName(), path.string());
        }
    }

    return {};
}

std::expected<parallax::plugin::Plugin, std::error_code>
PluginManager::GetPlugin(const std::string &name) {
    std::shared_lock lock(plugins_mutex_);
    auto it = plugins_.find(name);
    if (it == plugins_.end()) {
        return std::unexpected(
            std::make_error_code(std::errc::no_such_device_or_address));
    }
    return it->second;
}

std::vector<std::string> PluginManager::GetAvailableSources() {
    std::shared_lock lock(plugins_mutex_);
    std::vector<std::string> sources;
    for (const auto &[name, plugin] : plugins_) {
        if (plugin.as<parallax::plugin::ITrackingSource>())
            sources.emplace_back(name);
    }
    std::sort(sources.begin(), sources.end());
    return sources;
}

const std::vector<std::pair<std::string, std::error_code>> &
PluginManager::GetLoadErrors() const {
    return load_errors_;
}

std::error_code PluginManager::UnloadPlugin(const std::string &name) {
    std::unique_lock lock(plugins_mutex_);
    auto it = plugins_.find(name);
    if (it == plugins_.end()) {
        return std::make_error_code(std::errc::no_such_device_or_address);
    }
    plugins_.erase(it);
    return {};
}

// Expects one subdirectory per plugin: <dir>/<plugin>/lib<plugin>.so
void PluginManager::LoadPluginsFromDirectory_(
    const std::filesystem::path &dir) {
    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) {
        spdlog::warn("Plugins directory does not exist: {}", dir.string());
        return;
    }

    if (!std::filesystem::is_directory(dir, ec)) {
        spdlog::warn("Plugins path is not a directory: {}", dir.string());
        return;
    }

    try {
        for (const auto &entry : std::filesystem::directory_iterator(dir)) {
            if (!entry.is_directory(ec))
                continue;

            for (const auto &file :
                 std::filesystem::directory_iterator(entry.path())) {
                if (!file.is_regular_file(ec) ||
                    !IsPluginLibrary_(file.path()))
                    continue;

                auto load_ec = LoadPlugin(file.path());
                if (load_ec) {
                    load_errors_.emplace_back(file.path().string(), load_ec);
                    spdlog::warn("Failed to load plugin {}: {}",
                                 file.path().filename().string(),
                                 load_ec.message());
                } else {
                    spdlog::info("Loaded plugin: {}",
                                 file.path().filename().string());
                }
            }
        }
    } catch (const std::exception &e) {
        spdlog::error("Error scanning plugins directory: {}", e.what());
    }
}

bool PluginManager::IsPluginLibrary_(const std::filesystem::path &file) {
    auto extension = file.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return extension == ".dylib" || extension == ".so";
}

} // namespace parallax_rt::managers
