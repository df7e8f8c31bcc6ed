#pragma once

#include <chrono>
#include <cstdint>
#include <limits>
#include <string>

namespace shopstream {

/**
 * @brief Common utilities
 */

// Version information
constexpr const char* SHOPSTREAM_VERSION = "0.1.0";
constexpr int SHOPSTREAM_VERSION_MAJOR = 0;
constexpr int SHOPSTREAM_VERSION_MINOR = 1;
constexpr int SHOPSTREAM_VERSION_PATCH = 0;

/**
 * @brief Watermark value before any event has been observed
 */
constexpr int64_t NO_WATERMARK = std::numeric_limits<int64_t>::min();

/**
 * @brief Duration value meaning "no bound" (lateness, match window)
 */
constexpr int64_t UNBOUNDED = std::numeric_limits<int64_t>::max();

/**
 * @brief Wall-clock time in milliseconds since epoch
 */
inline int64_t current_time_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()).count();
}

/**
 * @brief Saturating a + b for event-time arithmetic with UNBOUNDED operands
 */
inline int64_t saturating_add(int64_t a, int64_t b) {
    if (b > 0 && a > std::numeric_limits<int64_t>::max() - b) {
        return std::numeric_limits<int64_t>::max();
    }
    if (b < 0 && a < std::numeric_limits<int64_t>::min() - b) {
        return std::numeric_limits<int64_t>::min();
    }
    return a + b;
}

/**
 * @brief Saturating a - b
 */
inline int64_t saturating_sub(int64_t a, int64_t b) {
    if (b == std::numeric_limits<int64_t>::min()) {
        return saturating_add(a, std::numeric_limits<int64_t>::max());
    }
    return saturating_add(a, -b);
}

} // namespace shopstream
