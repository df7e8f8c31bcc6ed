#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace shopstream {

/**
 * @brief Process-wide stop flag that sleeping threads can wait on
 *
 * Every backoff sleep in the pipeline goes through wait_for() so that a
 * shutdown request interrupts it immediately.
 */
class ShutdownSignal {
public:
    void request() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requested_.store(true);
        }
        cv_.notify_all();
    }

    bool requested() const { return requested_.load(); }

    /**
     * @brief Sleep up to timeout
     * @return true if shutdown was requested (before or during the wait)
     */
    template <typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this]() { return requested_.load(); });
    }

    void reset() { requested_.store(false); }

private:
    std::atomic<bool> requested_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

/**
 * @brief Exponential backoff schedule: base * 2^attempt, capped
 */
inline std::chrono::milliseconds backoff_delay(int64_t base_ms, int attempt,
                                               int64_t cap_ms = 30000) {
    int64_t delay = base_ms;
    for (int i = 0; i < attempt && delay < cap_ms; ++i) {
        delay *= 2;
    }
    return std::chrono::milliseconds(std::min(delay, cap_ms));
}

} // namespace shopstream
