#pragma once
#include "interfaces.hpp"
#include <cstdint>
#include <dlfcn.h>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>

namespace parallax::plugin {

// Encode major.minor.patch into a single uint32: 0xMMmmpppp
constexpr uint32_t make_version(uint8_t major, uint8_t minor, uint16_t patch) {
    return (static_cast<uint32_t>(major) << 24) |
           (static_cast<uint32_t>(minor) << 16) | static_cast<uint32_t>(patch);
}

struct PluginInfo {
    std::string name;
    std::string description;
    uint32_t version{0};
};

using PluginCreateFcn = IPlugin *(void);
using PluginDestroyFcn = void(IPlugin *);
using PluginNameFcn = const char *();
using PluginDescriptionFcn = const char *();
using PluginVersionFcn = uint32_t();

// A loaded shared object plus one instance created from it. Copies share
// both; the instance is destroyed before the library is closed.
class Plugin {
  public:
    Plugin() = default;

    Plugin(void *handle, PluginCreateFcn *create, PluginDestroyFcn *destroy,
           PluginInfo info, std::filesystem::path path = {})
        : info_(std::move(info)), path_(std::move(path)) {
        handle_ = std::shared_ptr<void>(handle, [](void *h) {
            if (h)
                dlclose(h);
        });

        auto library = handle_;
        instance_ = std::shared_ptr<IPlugin>(
            create(), [destroy, library](IPlugin *p) {
                if (p && destroy)
                    destroy(p);
            });
        if (instance_)
            instance_->setName(info_.name.c_str());
    }

    IPlugin *get() const { return instance_.get(); }
    IPlugin *operator->() const { return get(); }
    const std::string &getName() const { return info_.name; }
    const std::string &getDescription() const { return info_.description; }
    uint32_t getVersion() const { return info_.version; }
    const PluginInfo &getInfo() const { return info_; }
    const std::filesystem::path &getPath() const { return path_; }
    explicit operator bool() const { return instance_ != nullptr; }

    template <typename T> T *as() const {
        if (!instance_)
            return nullptr;
        return instance_->queryInterface<T>();
    }

  private:
    std::shared_ptr<void> handle_;
    std::shared_ptr<IPlugin> instance_;
    PluginInfo info_;
    std::filesystem::path path_;
};
} // namespace parallax::plugin

#define PARALLAX_PLUGIN_ENTRY(CLASS_NAME, NAME, DESCRIPTION, VERSION)          \
    extern "C" {                                                               \
    parallax::plugin::IPlugin *createPlugin() { return new CLASS_NAME(); }     \
    void destroyPlugin(parallax::plugin::IPlugin *plugin) { delete plugin; }   \
    const char *pluginName() { return NAME; }                                  \
    const char *pluginDescription() { return DESCRIPTION; }                    \
    uint32_t pluginVersion() { return VERSION; }                               \
    }
