#pragma once

#include <cstdint>
#include <mutex>
#include <optional>

namespace parallax::core {

// Single-value handoff between a producer thread and the render tick.
// Each publish overwrites the previous value; take() empties the slot.
// Once closed, publishes are dropped until reopen().
template <typename T> class LatestSlot {
  public:
    bool publish(T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_)
            return false;
        value_ = std::move(value);
        ++published_;
        return true;
    }

    std::optional<T> take() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::optional<T> out = std::move(value_);
        value_.reset();
        return out;
    }

    bool hasValue() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return value_.has_value();
    }

    // Drops any pending value.
    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        value_.reset();
    }

    void reopen() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = false;
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    uint64_t publishedCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return published_;
    }

  private:
    mutable std::mutex mutex_;
    std::optional<T> value_;
    bool closed_{false};
    uint64_t published_{0};
};

} // namespace parallax::core
