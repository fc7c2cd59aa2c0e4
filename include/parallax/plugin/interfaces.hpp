#pragma once
#include "parallax/core/core.hpp"
#include "parallax/core/queue.hpp"
#include "parallax/core/thread.hpp"
#include "parallax/core/utils.hpp"
#include <glaze/glaze.hpp>
#include <stop_token>
#include <string>

#define PARALLAX_DEFINE_INTERFACE_ID(name)                                     \
    static constexpr InterfaceID iid = {parallax::core::hash_string(#name)};

#define PARALLAX_REGISTER_TYPED_INTERFACE(Interface, Type, Alias)              \
    template <>                                                                \
    inline constexpr InterfaceID Interface<Type>::iid = {                      \
        parallax::core::hash_string(#Interface "<" #Type ">")};                \
    using Alias = Interface<Type>;

namespace parallax::plugin {

struct InterfaceID {
    uint64_t value;

    constexpr bool operator==(const InterfaceID &other) const {
        return value == other.value;
    }
};

struct ILifecycle {
    virtual void init() = 0;
    virtual void pause() = 0;
    virtual void resume() = 0;
    virtual void shutdown() = 0;
    virtual void reset() = 0;
    virtual ~ILifecycle() = default;
};

struct IConfigurable {
    PARALLAX_DEFINE_INTERFACE_ID(IConfigurable)
    virtual const char *getConfigSchema() = 0;
    virtual const char *getDefaultConfig() = 0;
    // Returns false when the string did not parse; defaults are used then.
    virtual bool setConfigStr(const char *config_str) = 0;
    virtual ~IConfigurable() = default;
};

template <typename TConfig>
class ConfigurableBase : public virtual IConfigurable {
  public:
    const char *getConfigSchema() override {
        auto err = glz::write_json_schema<TConfig>(schema_buffer_);
        if (err) {
            return "{}";
        }
        return schema_buffer_.c_str();
    }

    const char *getDefaultConfig() override {
        auto err = glz::write_json(TConfig{}, default_config_buffer_);
        if (err) {
            return "{}";
        }
        return default_config_buffer_.c_str();
    }

    bool setConfigStr(const char *config_str) override {
        std::string buffer = config_str ? config_str : "";
        if (buffer.empty()) {
            config_ = TConfig();
            return true;
        }
        auto config = glz::read_json<TConfig>(buffer);
        if (!config) {
            config_ = TConfig();
            return false;
        }
        config_ = std::move(config.value());
        return true;
    }

  protected:
    const TConfig &getConfig() const { return config_; }

  private:
    std::string schema_buffer_;
    std::string default_config_buffer_;
    TConfig config_{};
};

template <typename T> struct ISource {
    static constexpr InterfaceID iid{};
    // Blocks until a sample is available or `stoken` is triggered.
    virtual bool waitForData(T &out, std::stop_token stoken) = 0;
    virtual void cancel() = 0;
    virtual ~ISource() = default;
};

PARALLAX_REGISTER_TYPED_INTERFACE(ISource, core::TrackingSample,
                                  ITrackingSource);

struct IPlugin : public virtual ILifecycle {
    PARALLAX_DEFINE_INTERFACE_ID(IPlugin);
    virtual void *queryInterfaceImpl(InterfaceID id) noexcept = 0;

    template <typename I> I *queryInterface() noexcept {
        return static_cast<I *>(queryInterfaceImpl(I::iid));
    }

    virtual void setName(const char *name) = 0;
    virtual const char *getName() const = 0;
};

template <typename... Interfaces>
class PluginBase : public IPlugin, public virtual Interfaces... {
  public:
    void *queryInterfaceImpl(InterfaceID id) noexcept override {
        if (id == IPlugin::iid)
            return static_cast<IPlugin *>(this);

        void *out = nullptr;
        (try_one<Interfaces>(id, out) || ...);
        return out;
    }

    void init() override { onInit(); }
    void shutdown() override { onShutdown(); }
    void pause() override { onPause(); }
    void resume() override { onResume(); }
    void reset() override { onReset(); }

    void setName(const char *name) override { name_ = name; }
    const char *getName() const override { return name_.c_str(); }

  protected:
    virtual void onInit() = 0;
    virtual void onShutdown() = 0;
    virtual void onPause() {}
    virtual void onResume() {}
    virtual void onReset() = 0;

    ~PluginBase() = default;

  private:
    template <typename I> bool try_one(InterfaceID id, void *&out) noexcept {
        if (id == I::iid) {
            out = static_cast<I *>(this);
            return true;
        }
        return false;
    }

    std::string name_;
};

// Producer thread feeding a short queue. Only the newest samples matter, so
// the queue drops its oldest entry when the consumer falls behind.
template <typename T>
class SourceBase : public virtual ISource<T>,
                   public core::Thread<SourceBase<T>> {
  public:
    static constexpr std::size_t kQueueCapacity = 4;

    bool waitForData(T &out, std::stop_token stoken) override final {
        std::stop_callback cb(stoken, [this] { cancel(); });
        return output_queue_.wait_and_pop(out, cancel_source_.get_token());
    }

    void cancel() override final { cancel_source_.request_stop(); }

    void startProducing() {
        cancel_source_ = std::stop_source{};
        output_queue_.clear();
        this->Spawn();
    }

    void stopProducing() {
        cancel();
        this->Stop();
    }

    // Thread<T> CRTP interface
    void Init() {}
    void Run() {
        T sample{};
        if (onProduce(sample, this->get_stop_token()))
            output_queue_.push(std::move(sample));
    }
    void Shutdown() {}

  protected:
    // Returns false when nothing was produced this round. Must return
    // promptly once `stoken` is triggered.
    virtual bool onProduce(T &out, std::stop_token stoken) = 0;

  private:
    core::Queue<T> output_queue_{kQueueCapacity};
    std::stop_source cancel_source_;
};

using TrackingSourceBase = SourceBase<core::TrackingSample>;

template <typename Config>
class SourcePluginBase
    : public PluginBase<TrackingSourceBase, ConfigurableBase<Config>> {
    using Base = PluginBase<TrackingSourceBase, ConfigurableBase<Config>>;

  public:
    void init() override {
        Base::init();
        TrackingSourceBase::startProducing();
    }

    void pause() override {
        TrackingSourceBase::Pause();
        Base::pause();
    }

    void resume() override {
        Base::resume();
        TrackingSourceBase::Resume();
    }

    void shutdown() override {
        TrackingSourceBase::stopProducing();
        Base::shutdown();
    }
};

} // namespace parallax::plugin
