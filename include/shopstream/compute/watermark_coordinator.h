/**
 * @file watermark_coordinator.h
 * @brief Global low watermark over the per-source watermarks
 */

#pragma once

#include "shopstream/core/records.h"
#include "shopstream/utils/common.h"
#include <array>
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace shopstream {
namespace compute {

/**
 * @brief Progress status of one source
 */
struct SourceWatermarkStatus {
    StreamKind kind = StreamKind::Views;
    bool registered = false;
    bool bounded = true;            ///< Unbounded sources never hold back the global watermark
    bool available = true;          ///< False while the adapter reports SourceUnavailable
    bool stalled = false;           ///< Bounded, and no progress within stall_timeout
    int64_t watermark = NO_WATERMARK;
    int64_t last_progress_ms = 0;   ///< Wall clock of the last watermark advance
};

/**
 * @brief Snapshot for health reporting
 */
struct WatermarkHealth {
    int64_t global_watermark = NO_WATERMARK;
    bool stalled = false;           ///< Any bounded source stalled
    std::vector<SourceWatermarkStatus> sources;
};

/**
 * @brief Watermark coordinator
 *
 * globalWatermark = min(watermark of every registered bounded source).
 * It stays NO_WATERMARK until every bounded source has reported, never
 * regresses, and freezes while any bounded source stalls. Stalls are not
 * worked around, only reported: finalizing early would drop sales.
 *
 * Thread-safe; updated from the join loop, read from health reporting.
 */
class WatermarkCoordinator {
public:
    explicit WatermarkCoordinator(int64_t stall_timeout_ms = 60000);

    /**
     * @brief Register a source
     * @param bounded false for dimension streams with unbounded lateness
     */
    void registerSource(StreamKind kind, bool bounded, int64_t now_ms = current_time_ms());

    /**
     * @brief Report a source watermark
     * @return true if the global watermark advanced
     *
     * Regressions of a source watermark are ignored.
     */
    bool updateSourceWatermark(StreamKind kind, int64_t watermark,
                               int64_t now_ms = current_time_ms());

    /**
     * @brief Record adapter availability (SourceUnavailable / recovered)
     */
    void reportAvailability(StreamKind kind, bool available);

    int64_t globalWatermark() const { return global_watermark_.load(); }

    int64_t sourceWatermark(StreamKind kind) const;

    /**
     * @brief Bounded sources whose watermark has not moved for stall_timeout
     */
    std::vector<StreamKind> stalledSources(int64_t now_ms = current_time_ms()) const;

    WatermarkHealth health(int64_t now_ms = current_time_ms()) const;

    /**
     * @brief Reinstate watermarks from a checkpoint
     */
    void restore(const std::map<StreamKind, int64_t>& source_watermarks,
                 int64_t global_watermark, int64_t now_ms = current_time_ms());

    std::map<std::string, int64_t> getStats() const;

private:
    bool recomputeLocked();
    bool isStalledLocked(const SourceWatermarkStatus& status, int64_t now_ms) const;

    int64_t stall_timeout_ms_;
    std::array<SourceWatermarkStatus, STREAM_KIND_COUNT> sources_;
    std::atomic<int64_t> global_watermark_{NO_WATERMARK};
    int64_t global_advances_ = 0;
    int64_t ignored_regressions_ = 0;
    mutable std::mutex mutex_;
};

} // namespace compute
} // namespace shopstream
