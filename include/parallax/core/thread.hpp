#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>
#include <thread>

namespace parallax::core {

// CRTP worker. Derived provides Init(), Run() and Shutdown(); Run() is
// called repeatedly until Stop() and must return periodically.
template <typename Derived> class Thread {
  public:
    Thread() = default;
    Thread(const Thread &) = delete;
    Thread &operator=(const Thread &) = delete;

    void Spawn() {
        if (thread_.joinable())
            return;

        thread_ = std::jthread(
            [this](std::stop_token token) { threadFcn_(token); });
    }

    void Stop() {
        if (!thread_.joinable())
            return;
        thread_.request_stop();
        pause_cv_.notify_one();
        thread_.join();
    }

    void Pause() {
        if (!thread_.joinable())
            return;
        pause_requested_.store(true, std::memory_order_release);
        pause_cv_.notify_one();
    }

    void Resume() {
        if (!thread_.joinable())
            return;
        pause_requested_.store(false, std::memory_order_release);
        pause_cv_.notify_one();
    }

  protected:
    ~Thread() = default;

    std::stop_token get_stop_token() const { return thread_.get_stop_token(); }

  private:
    std::jthread thread_;
    std::condition_variable_any pause_cv_;
    std::mutex pause_mtx_;
    std::atomic<bool> pause_requested_{false};

    void threadFcn_(std::stop_token stop_token) {
        static_cast<Derived *>(this)->Init();

        while (!stop_token.stop_requested()) {
            if (pause_requested_.load(std::memory_order_acquire)) {
                std::unique_lock<std::mutex> lock(pause_mtx_);
                bool resume = pause_cv_.wait_for(
                    lock, stop_token, std::chrono::milliseconds(10),
                    [&] { return !pause_requested_; });
                if (stop_token.stop_requested())
                    break;
                if (!resume)
                    continue;
            }
            static_cast<Derived *>(this)->Run();
        }

        static_cast<Derived *>(this)->Shutdown();
    }
};

} // namespace parallax::core
