#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <utility>

namespace sampleconv::convert {

/// Capacity-one hand-over between a producer thread and a consumer thread.
///
/// The producer calls waitForDelivery() before starting expensive work, then deliver(),
/// and finish() when it has nothing more. The consumer calls receive() until it returns
/// std::nullopt. cancel() wakes both sides; a value that was not taken yet is dropped.
template <typename T>
class DeliverySlot {
public:
    /// Blocks until the previous value was taken. Returns true when the slot was cancelled.
    bool waitForDelivery() {
        std::unique_lock<std::mutex> lock(mutex_);
        changed_.wait(lock, [this] { return cancelled_ || !value_.has_value(); });
        return cancelled_;
    }

    /// Stores a value for the consumer, waiting for a free slot first. Returns false when
    /// the slot was cancelled and the value was dropped.
    bool deliver(T value) {
        std::unique_lock<std::mutex> lock(mutex_);
        changed_.wait(lock, [this] { return cancelled_ || !value_.has_value(); });
        if (cancelled_) {
            return false;
        }
        value_ = std::move(value);
        changed_.notify_all();
        return true;
    }

    void finish() {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_ = true;
        changed_.notify_all();
    }

    void cancel() {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
        value_.reset();
        changed_.notify_all();
    }

    [[nodiscard]] bool isCancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

    /// Blocks until a value arrives. Returns std::nullopt once the producer finished with
    /// nothing pending, or when the slot was cancelled.
    std::optional<T> receive() {
        std::unique_lock<std::mutex> lock(mutex_);
        changed_.wait(lock, [this] { return cancelled_ || finished_ || value_.has_value(); });
        if (cancelled_ || !value_.has_value()) {
            return std::nullopt;
        }
        std::optional<T> result = std::move(value_);
        value_.reset();
        changed_.notify_all();
        return result;
    }

    [[nodiscard]] bool hasPendingValue() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return value_.has_value();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable changed_;
    std::optional<T> value_;
    bool finished_ = false;
    bool cancelled_ = false;
};

}  // namespace sampleconv::convert
