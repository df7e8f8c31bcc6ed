/**
 * @file enrichment_pipeline.h
 * @brief End-to-end wiring: sources -> join loop -> sink, with checkpoints
 */

#pragma once

#include "shopstream/algorithms/enrichment_join.h"
#include "shopstream/compute/checkpoint_manager.h"
#include "shopstream/compute/keyed_state_store.h"
#include "shopstream/compute/watermark_coordinator.h"
#include "shopstream/io/checkpoint_store.h"
#include "shopstream/io/dead_letter.h"
#include "shopstream/io/sink_writer.h"
#include "shopstream/io/source_adapter.h"
#include "shopstream/io/stream_source.h"
#include "shopstream/io/upsert_sink.h"
#include "shopstream/utils/bounded_queue.h"
#include "shopstream/utils/config.h"
#include "shopstream/utils/shutdown_signal.h"
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace shopstream {

/**
 * @brief External systems the pipeline reads from and writes to
 */
struct PipelineEndpoints {
    std::unique_ptr<io::PartitionedStreamSource> products;
    std::unique_ptr<io::PartitionedStreamSource> users;
    std::unique_ptr<io::PartitionedStreamSource> sales;
    std::unique_ptr<io::PartitionedStreamSource> views;
    std::unique_ptr<io::UpsertSink> sink;
    std::unique_ptr<io::DeadLetterOutput> dead_letter;
    std::unique_ptr<io::CheckpointStore> checkpoint_store;
};

/**
 * @brief Streaming enrichment pipeline
 *
 * Threads:
 * - One worker per source polls its adapter into the bounded ingestion queue
 * - The join loop is the only writer of the state store
 * - The sink writer consumes the bounded output queue
 * - The checkpoint thread asks the join loop for a snapshot between
 *   batches every checkpoint_interval, waits for the sink to deliver
 *   everything emitted before it, then persists it
 *
 * A full output queue blocks the join loop, which fills the ingestion
 * queue, which blocks the source workers.
 *
 * Usage:
 * 1. Construct with config and endpoints
 * 2. start() restores the latest valid checkpoint and launches the threads
 * 3. shutdown() drains, checkpoints and flushes within the grace period
 */
class EnrichmentPipeline {
public:
    EnrichmentPipeline(const PipelineConfig& config, PipelineEndpoints endpoints);

    ~EnrichmentPipeline();

    bool start();

    /**
     * @brief Graceful shutdown
     *
     * Stops the source workers, drains the ingestion queue, writes a final
     * checkpoint and flushes the sink. Past shutdown_grace_period in-flight
     * work is abandoned; it is replayed from the last checkpoint on restart.
     */
    void shutdown();

    bool isRunning() const { return running_.load(); }

    /**
     * @brief Take a checkpoint now
     * @return true if a checkpoint was persisted
     */
    bool checkpointNow(std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    /**
     * @brief Wait until every source is exhausted and all output delivered
     * @return false on timeout or failure
     */
    bool waitUntilIdle(std::chrono::milliseconds timeout);

    /**
     * @brief Set after a fatal error (capacity exceeded, dead-letter overflow)
     */
    bool failed() const;
    std::string failureReason() const;

    compute::WatermarkHealth health() const { return coordinator_.health(); }

    /**
     * @brief Outcome of the restore performed by start()
     *
     * The restored checkpoint's state snapshot is released once applied.
     */
    const compute::RestoreResult& restoreResult() const { return restore_result_; }

    std::map<std::string, int64_t> getStats() const;

private:
    struct SourceWorker {
        std::unique_ptr<io::SourceAdapter> adapter;
        std::unique_ptr<std::thread> thread;
        std::atomic<bool> drained{false};
        std::atomic<int64_t> batches{0};
        std::atomic<int64_t> records{0};
        std::atomic<int64_t> malformed{0};
        std::atomic<int64_t> unavailable_polls{0};
    };

    void restore();
    void sourceLoop(SourceWorker* worker);
    void joinLoop();
    void checkpointLoop();
    void applyBatch(const io::SourceBatch& batch);
    void emitRecord(const EnrichedRecord& record);
    void serviceSnapshotRequest();
    compute::Checkpoint captureCheckpoint() const;
    bool takeCheckpoint(std::chrono::milliseconds timeout);
    void fail(const std::string& reason);
    void publishJoinStats();

    PipelineConfig config_;
    PipelineEndpoints endpoints_;

    ShutdownSignal stop_sources_;
    ShutdownSignal stop_checkpoints_;
    ShutdownSignal abort_;
    ShutdownSignal shutdown_complete_;

    compute::KeyedStateStore store_;
    compute::WatermarkCoordinator coordinator_;
    compute::CheckpointManager checkpoint_manager_;
    io::UpsertSinkWriter sink_writer_;
    EnrichmentJoin join_;

    std::array<std::unique_ptr<SourceWorker>, STREAM_KIND_COUNT> workers_;
    BoundedQueue<io::SourceBatch> ingestion_;
    std::unique_ptr<std::thread> join_thread_;
    std::unique_ptr<std::thread> checkpoint_thread_;

    // Owned by the join loop
    std::map<StreamKind, std::map<int32_t, int64_t>> applied_offsets_;

    // Snapshot handoff between the checkpoint requester and the join loop
    mutable std::mutex snapshot_mutex_;
    std::condition_variable snapshot_cv_;
    bool snapshot_requested_ = false;
    std::optional<compute::Checkpoint> captured_;
    std::atomic<bool> join_running_{false};
    std::mutex checkpoint_mutex_;

    std::atomic<bool> running_{false};
    std::atomic<bool> failed_{false};
    std::string failure_reason_;
    mutable std::mutex failure_mutex_;

    std::atomic<int64_t> batches_pushed_{0};
    std::atomic<int64_t> batches_applied_{0};

    mutable std::mutex stats_mutex_;
    std::map<std::string, int64_t> join_stats_;

    compute::RestoreResult restore_result_;
};

} // namespace shopstream
