#pragma once

#include <queue>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <vector>

namespace companion {

/**
 * @brief Thread-safe event queue between listener threads and the control loop
 *
 * Voice, debug console and display window threads push; the control loop
 * drains once per tick. Bounded: when full the oldest event is dropped.
 */
template<typename T>
class AsyncQueue {
public:
    explicit AsyncQueue(size_t max_size = 32) : max_size_(max_size) {}

    // Non-blocking push (drops oldest if full)
    void push(T item) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (queue_.size() >= max_size_) {
            queue_.pop();
            dropped_++;
        }

        queue_.push(std::move(item));
        cv_.notify_one();
    }

    // Blocking pop with timeout
    std::optional<T> pop(int timeout_ms = 100) {
        std::unique_lock<std::mutex> lock(mutex_);

        if (!cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                          [this] { return !queue_.empty() || closed_; })) {
            return std::nullopt;
        }

        if (queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);

        if (queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    /** Take everything queued so far, in arrival order */
    std::vector<T> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> items;
        items.reserve(queue_.size());
        while (!queue_.empty()) {
            items.push_back(std::move(queue_.front()));
            queue_.pop();
        }
        return items;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        while (!queue_.empty()) {
            queue_.pop();
        }
    }

    // Wakes blocked pop() callers
    void close() {
        closed_ = true;
        cv_.notify_all();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    uint64_t dropped_count() const {
        return dropped_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<T> queue_;
    size_t max_size_;
    std::atomic<bool> closed_{false};
    std::atomic<uint64_t> dropped_{0};
};

} // namespace companion
