#include "shopstream/compute/watermark_coordinator.h"
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace shopstream {
namespace compute {

WatermarkCoordinator::WatermarkCoordinator(int64_t stall_timeout_ms)
    : stall_timeout_ms_(stall_timeout_ms) {
    if (stall_timeout_ms_ <= 0) {
        throw std::invalid_argument("WatermarkCoordinator: stall timeout must be positive");
    }
    for (StreamKind kind : ALL_STREAM_KINDS) {
        sources_[stream_index(kind)].kind = kind;
    }
}

void WatermarkCoordinator::registerSource(StreamKind kind, bool bounded, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& status = sources_[stream_index(kind)];
    status.registered = true;
    status.bounded = bounded;
    status.available = true;
    status.last_progress_ms = now_ms;
    recomputeLocked();
}

bool WatermarkCoordinator::updateSourceWatermark(StreamKind kind, int64_t watermark,
                                                 int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& status = sources_[stream_index(kind)];
    if (!status.registered) {
        throw std::invalid_argument("WatermarkCoordinator: source not registered: " +
                                    stream_kind_to_string(kind));
    }

    if (watermark < status.watermark) {
        ignored_regressions_++;
        return false;
    }
    if (watermark > status.watermark) {
        status.watermark = watermark;
        status.last_progress_ms = now_ms;
    }
    return recomputeLocked();
}

void WatermarkCoordinator::reportAvailability(StreamKind kind, bool available) {
    std::lock_guard<std::mutex> lock(mutex_);
    sources_[stream_index(kind)].available = available;
}

int64_t WatermarkCoordinator::sourceWatermark(StreamKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sources_[stream_index(kind)].watermark;
}

std::vector<StreamKind> WatermarkCoordinator::stalledSources(int64_t now_ms) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StreamKind> stalled;
    for (const auto& status : sources_) {
        if (isStalledLocked(status, now_ms)) {
            stalled.push_back(status.kind);
        }
    }
    return stalled;
}

WatermarkHealth WatermarkCoordinator::health(int64_t now_ms) const {
    std::lock_guard<std::mutex> lock(mutex_);
    WatermarkHealth health;
    health.global_watermark = global_watermark_.load();
    for (const auto& status : sources_) {
        if (!status.registered) {
            continue;
        }
        SourceWatermarkStatus copy = status;
        copy.stalled = isStalledLocked(status, now_ms);
        health.stalled = health.stalled || copy.stalled;
        health.sources.push_back(copy);
    }
    return health;
}

void WatermarkCoordinator::restore(const std::map<StreamKind, int64_t>& source_watermarks,
                                   int64_t global_watermark, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [kind, watermark] : source_watermarks) {
        auto& status = sources_[stream_index(kind)];
        status.watermark = std::max(status.watermark, watermark);
        status.last_progress_ms = now_ms;
    }
    if (global_watermark > global_watermark_.load()) {
        global_watermark_.store(global_watermark);
    }
    recomputeLocked();
}

std::map<std::string, int64_t> WatermarkCoordinator::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, int64_t> stats = {
        {"global_watermark", global_watermark_.load()},
        {"global_advances", global_advances_},
        {"ignored_regressions", ignored_regressions_}
    };
    int64_t now_ms = current_time_ms();
    int64_t stalled = 0;
    for (const auto& status : sources_) {
        if (!status.registered) {
            continue;
        }
        std::string name = stream_kind_to_string(status.kind);
        stats["watermark." + name] = status.watermark;
        stats["available." + name] = status.available ? 1 : 0;
        if (isStalledLocked(status, now_ms)) {
            stalled++;
        }
    }
    stats["stalled_sources"] = stalled;
    return stats;
}

// ========== Private Helper Methods ==========

bool WatermarkCoordinator::recomputeLocked() {
    int64_t min_watermark = std::numeric_limits<int64_t>::max();
    bool any_bounded = false;

    for (const auto& status : sources_) {
        if (!status.registered || !status.bounded) {
            continue;
        }
        any_bounded = true;
        min_watermark = std::min(min_watermark, status.watermark);
    }

    if (!any_bounded || min_watermark == NO_WATERMARK) {
        return false;
    }

    // Watermarks must be monotonically increasing
    if (min_watermark > global_watermark_.load()) {
        global_watermark_.store(min_watermark);
        global_advances_++;
        return true;
    }
    return false;
}

bool WatermarkCoordinator::isStalledLocked(const SourceWatermarkStatus& status,
                                           int64_t now_ms) const {
    if (!status.registered || !status.bounded) {
        return false;
    }
    return now_ms - status.last_progress_ms > stall_timeout_ms_;
}

} // namespace compute
} // namespace shopstream
