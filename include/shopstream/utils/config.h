#pragma once

#include "shopstream/core/records.h"
#include "shopstream/utils/common.h"
#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace shopstream {

/**
 * @brief Raw key-value configuration (file or programmatic)
 */
using ConfigMap = std::map<std::string, std::string>;

/**
 * @brief What to do when pending views exceed max_pending_views
 */
enum class CapacityPolicy {
    Fail,                 ///< Raise StateStoreCapacityExceeded (default)
    ForceFinalizeOldest   ///< Finalize the oldest pending views early
};

/**
 * @brief Per-source polling and lateness settings
 */
struct SourceConfig {
    int64_t allowed_lateness_ms = 30000;  ///< UNBOUNDED for dimension streams
    size_t poll_batch_size = 256;         ///< Max records per partition per poll
    int64_t poll_interval_ms = 50;        ///< Idle sleep when a poll returns nothing
    int retry_attempts = 5;               ///< Read attempts before reporting SourceUnavailable
    int64_t retry_backoff_ms = 50;        ///< Base of the exponential backoff

    bool bounded() const { return allowed_lateness_ms != UNBOUNDED; }
};

/**
 * @brief Join engine settings
 */
struct JoinConfig {
    int64_t match_window_ms = UNBOUNDED;  ///< sale.event_time <= view.event_time + window
    int64_t lateness_ms = 30000;          ///< Pending deadline = view.event_time + lateness
    size_t max_pending_views = 1000000;   ///< 0 = unlimited
    CapacityPolicy capacity_policy = CapacityPolicy::Fail;
    int64_t finalized_retention_ms = 300000;  ///< Redelivery guard past the deadline
};

/**
 * @brief Upsert sink writer settings
 */
struct SinkWriterConfig {
    std::string index = "enriched_views";
    size_t batch_size = 500;
    int64_t batch_interval_ms = 1000;
    int max_retry_attempts = 5;
    int64_t retry_backoff_ms = 100;
    size_t output_queue_capacity = 10000;
    size_t dead_letter_capacity = 100000;
};

/**
 * @brief Checkpoint manager settings
 */
struct CheckpointConfig {
    int64_t interval_ms = 30000;
    std::string store_location = "./shopstream_checkpoints";
    size_t retain_count = 3;
    int write_attempts = 3;
    int64_t write_backoff_ms = 100;
};

/**
 * @brief Complete pipeline configuration
 *
 * Recognized keys (durations in milliseconds, "unbounded" where allowed):
 * - allowed_lateness.{products,users,sales,views}
 * - checkpoint_interval, checkpoint_store_location, checkpoint_retain_count,
 *   checkpoint_write_attempts
 * - match_window, finalized_view_retention
 * - sink_index, sink_batch_size, sink_batch_interval, max_sink_retry_attempts,
 *   sink_retry_backoff, dead_letter_capacity, output_queue_capacity
 * - ingestion_queue_capacity, source_poll_batch_size, source_poll_interval,
 *   source_retry_attempts, source_retry_backoff
 * - stall_timeout, max_pending_views, capacity_policy, shutdown_grace_period
 */
struct PipelineConfig {
    std::array<SourceConfig, STREAM_KIND_COUNT> sources;
    JoinConfig join;
    SinkWriterConfig sink;
    CheckpointConfig checkpoint;
    size_t ingestion_queue_capacity = 64;
    int64_t stall_timeout_ms = 60000;
    int64_t shutdown_grace_ms = 10000;

    PipelineConfig();

    SourceConfig& source(StreamKind kind) { return sources[stream_index(kind)]; }
    const SourceConfig& source(StreamKind kind) const { return sources[stream_index(kind)]; }

    /**
     * @brief Build from key-value pairs; unknown keys are ignored
     * @throws std::invalid_argument on unparsable or inconsistent values
     */
    static PipelineConfig from_map(const ConfigMap& config);
};

/**
 * @brief Parse a "key = value" file; '#' starts a comment
 * @throws std::runtime_error if the file cannot be opened
 * @throws std::invalid_argument on a line without '='
 */
ConfigMap load_config_file(const std::string& path);

/**
 * @brief Parse a millisecond duration, or "unbounded" when allowed
 */
int64_t parse_duration_ms(const std::string& value, bool allow_unbounded);

} // namespace shopstream
