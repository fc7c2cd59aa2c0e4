#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <stop_token>

namespace parallax::core {

// Blocking FIFO with an optional capacity. A full queue drops its oldest
// element on push, so a stalled consumer only ever sees recent samples.
template <typename T> class Queue {
  public:
    Queue() = default;
    explicit Queue(std::size_t capacity) : capacity_(capacity) {}

    void push(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (capacity_ != 0 && queue_.size() >= capacity_)
                queue_.pop_front();
            queue_.push_back(std::move(value));
        }
        cond_.notify_one();
    }

    bool wait_and_pop(T &value, std::stop_token stoken) {
        std::unique_lock<std::mutex> lock(mutex_);
        bool has_value =
            cond_.wait(lock, stoken, [this] { return !queue_.empty(); });

        if (!has_value) {
            return false;
        }

        value = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.clear();
    }

  private:
    mutable std::mutex mutex_;
    std::deque<T> queue_;
    std::condition_variable_any cond_;
    std::size_t capacity_{0};
};

} // namespace parallax::core
