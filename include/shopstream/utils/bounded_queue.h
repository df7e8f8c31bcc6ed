#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

namespace shopstream {

/**
 * @brief Bounded multi-producer / multi-consumer blocking queue
 *
 * push() blocks while the queue is full, which is how backpressure
 * propagates from the sink back to the source workers. close() wakes all
 * waiters; items still queued can be popped after close.
 */
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /**
     * @brief Push, blocking while full
     * @return false if the queue was closed
     */
    bool push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this]() {
            return closed_ || capacity_ == 0 || items_.size() < capacity_;
        });
        if (closed_) {
            return false;
        }
        items_.push_back(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Push, giving up after timeout
     * @return false if the queue was closed or still full at timeout
     */
    template <typename Rep, typename Period>
    bool push_for(T item, const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        bool ready = not_full_.wait_for(lock, timeout, [this]() {
            return closed_ || capacity_ == 0 || items_.size() < capacity_;
        });
        if (!ready || closed_) {
            return false;
        }
        items_.push_back(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Pop, blocking until an item arrives or the queue is closed and empty
     */
    bool pop(T& out) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this]() { return closed_ || !items_.empty(); });
        return take_locked(out);
    }

    /**
     * @brief Pop, giving up after timeout
     */
    template <typename Rep, typename Period>
    bool pop_for(T& out, const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait_for(lock, timeout,
                            [this]() { return closed_ || !items_.empty(); });
        return take_locked(out);
    }

    bool try_pop(T& out) {
        std::lock_guard<std::mutex> lock(mutex_);
        return take_locked(out);
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t capacity() const { return capacity_; }

private:
    bool take_locked(T& out) {
        if (items_.empty()) {
            return false;
        }
        out = std::move(items_.front());
        items_.pop_front();
        not_full_.notify_one();
        return true;
    }

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> items_;
    size_t capacity_;
    bool closed_ = false;
};

} // namespace shopstream
