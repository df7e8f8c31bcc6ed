/**
 * @file source_adapter.h
 * @brief Turns a partitioned log into decoded, watermarked batches
 */

#pragma once

#include "shopstream/core/records.h"
#include "shopstream/io/stream_source.h"
#include "shopstream/utils/config.h"
#include "shopstream/utils/shutdown_signal.h"
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace shopstream {
namespace io {

/**
 * @brief Result of one poll
 *
 * `offsets` are the next offsets to read per partition once every event
 * in this batch has been applied; the join loop checkpoints those.
 */
struct SourceBatch {
    StreamKind kind = StreamKind::Views;
    std::vector<StreamEvent> events;
    int64_t watermark = NO_WATERMARK;
    std::map<int32_t, int64_t> offsets;
    bool available = true;          ///< false: SourceUnavailable after all retries
    std::string error;
    size_t malformed = 0;
};

/**
 * @brief Stream source adapter
 *
 * Decodes JSON payloads into typed events and derives the source
 * watermark as max(event_time seen) - allowed_lateness. The watermark is
 * monotonic; with unbounded lateness it stays NO_WATERMARK.
 *
 * Read failures are retried with exponential backoff (interrupted by the
 * shutdown signal) and then reported in the batch, never thrown. Records
 * that fail to decode are skipped and counted; their offsets still advance.
 *
 * Not thread-safe: owned by one source worker.
 */
class SourceAdapter {
public:
    SourceAdapter(StreamKind kind,
                  std::unique_ptr<PartitionedStreamSource> source,
                  const SourceConfig& config,
                  ShutdownSignal* shutdown = nullptr);

    SourceBatch poll();

    int64_t currentWatermark() const { return watermark_; }

    /**
     * @brief Resume from checkpointed offsets and watermark
     *
     * Partitions missing from `offsets` start at their earliest offset.
     */
    void seek(const std::map<int32_t, int64_t>& offsets, int64_t watermark);

    void seekToEarliest();

    std::map<int32_t, int64_t> offsets() const { return offsets_; }

    bool exhausted() const { return source_->exhausted(); }

    StreamKind kind() const { return kind_; }
    const SourceConfig& config() const { return config_; }

    std::map<std::string, int64_t> getStats() const;

private:
    bool decode(const SourceMessage& message, StreamEvent& event);

    StreamKind kind_;
    std::unique_ptr<PartitionedStreamSource> source_;
    SourceConfig config_;
    ShutdownSignal* shutdown_;

    std::map<int32_t, int64_t> offsets_;
    int64_t max_event_time_ = NO_WATERMARK;
    int64_t watermark_ = NO_WATERMARK;

    // Statistics
    int64_t records_read_ = 0;
    int64_t malformed_records_ = 0;
    int64_t failed_polls_ = 0;
    int64_t read_retries_ = 0;
};

} // namespace io
} // namespace shopstream
