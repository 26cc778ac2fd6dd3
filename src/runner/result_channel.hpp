/**
 * @file result_channel.hpp
 * @brief Multi-producer, single-consumer channel delivering items in
 *        completion order.
 *
 * Producers push from worker threads; one consumer thread hands every item
 * to the callback in the order it was pushed. close() stops intake, waits
 * until the queue is drained and joins the consumer, so once it returns the
 * callback has seen every pushed item exactly once.
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <utility>

namespace sandbox_runner {

template <typename T>
class ResultChannel {
public:
    using Consumer = std::function<void(const T&)>;

    explicit ResultChannel(Consumer consumer)
        : consumer_(std::move(consumer))
        , thread_([this] { consume(); }) {}

    ~ResultChannel() { close(); }

    ResultChannel(const ResultChannel&) = delete;
    ResultChannel& operator=(const ResultChannel&) = delete;

    /// Returns false once the channel is closed; the item is dropped.
    bool push(T item) {
        {
            std::lock_guard lock(mutex_);
            if (closed_) return false;
            queue_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    /// Idempotent.
    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        cv_.notify_one();
        if (thread_.joinable()) thread_.join();
    }

    [[nodiscard]] size_t delivered() const {
        std::lock_guard lock(mutex_);
        return delivered_;
    }

private:
    void consume() {
        std::unique_lock lock(mutex_);
        for (;;) {
            cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
            if (queue_.empty()) return;   // closed and drained

            T item = std::move(queue_.front());
            queue_.pop_front();
            lock.unlock();
            consumer_(item);
            lock.lock();
            ++delivered_;
        }
    }

    Consumer consumer_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    bool closed_{false};
    size_t delivered_{0};
    std::jthread thread_;  // last: starts after every other member exists
};

}  // namespace sandbox_runner
