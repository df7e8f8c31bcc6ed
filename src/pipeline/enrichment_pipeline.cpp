#include "shopstream/pipeline/enrichment_pipeline.h"
#include "shopstream/core/errors.h"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace shopstream {

namespace {

std::unique_ptr<io::PartitionedStreamSource>& endpoint_for(PipelineEndpoints& endpoints,
                                                           StreamKind kind) {
    switch (kind) {
        case StreamKind::Products: return endpoints.products;
        case StreamKind::Users: return endpoints.users;
        case StreamKind::Sales: return endpoints.sales;
        case StreamKind::Views: return endpoints.views;
    }
    throw std::invalid_argument("unknown stream kind");
}

// Join loop wakes up at least this often to serve checkpoint requests
const std::chrono::milliseconds JOIN_POLL_TIMEOUT(50);

} // anonymous namespace

EnrichmentPipeline::EnrichmentPipeline(const PipelineConfig& config,
                                       PipelineEndpoints endpoints)
    : config_(config),
      endpoints_(std::move(endpoints)),
      store_(config.join.match_window_ms, config.join.lateness_ms,
             config.join.finalized_retention_ms),
      coordinator_(config.stall_timeout_ms),
      checkpoint_manager_(endpoints_.checkpoint_store.get(), config.checkpoint, &abort_),
      sink_writer_(config.sink, endpoints_.sink.get(), endpoints_.dead_letter.get(), &abort_),
      join_(config.join, &store_, &coordinator_,
            [this](const EnrichedRecord& record) { emitRecord(record); }),
      ingestion_(config.ingestion_queue_capacity) {
    for (StreamKind kind : ALL_STREAM_KINDS) {
        auto& source = endpoint_for(endpoints_, kind);
        if (!source) {
            throw std::invalid_argument("EnrichmentPipeline: missing " +
                                        stream_kind_to_string(kind) + " source");
        }
        auto worker = std::make_unique<SourceWorker>();
        worker->adapter = std::make_unique<io::SourceAdapter>(
            kind, std::move(source), config_.source(kind), &stop_sources_);
        workers_[stream_index(kind)] = std::move(worker);
        coordinator_.registerSource(kind, config_.source(kind).bounded());
    }
}

EnrichmentPipeline::~EnrichmentPipeline() {
    shutdown();
}

bool EnrichmentPipeline::start() {
    if (running_.load()) {
        std::cerr << "EnrichmentPipeline: already running" << std::endl;
        return false;
    }

    restore();

    sink_writer_.start();
    join_running_.store(true);
    join_thread_ = std::make_unique<std::thread>(&EnrichmentPipeline::joinLoop, this);
    for (auto& worker : workers_) {
        worker->thread = std::make_unique<std::thread>(
            &EnrichmentPipeline::sourceLoop, this, worker.get());
    }
    if (config_.checkpoint.interval_ms > 0) {
        checkpoint_thread_ = std::make_unique<std::thread>(
            &EnrichmentPipeline::checkpointLoop, this);
    }

    running_.store(true);
    std::cout << "EnrichmentPipeline: started (lateness sales="
              << config_.join.lateness_ms << "ms, checkpoint interval="
              << config_.checkpoint.interval_ms << "ms)" << std::endl;
    return true;
}

void EnrichmentPipeline::shutdown() {
    if (!running_.exchange(false)) {
        return;
    }
    std::cout << "EnrichmentPipeline: shutting down..." << std::endl;

    auto grace = std::chrono::milliseconds(config_.shutdown_grace_ms);
    auto deadline = std::chrono::steady_clock::now() + grace;
    std::thread watchdog([this, grace]() {
        if (!shutdown_complete_.wait_for(grace)) {
            std::cerr << "EnrichmentPipeline: grace period expired, abandoning in-flight"
                      << " work (replayed from the last checkpoint on restart)" << std::endl;
            abort_.request();
            ingestion_.close();
        }
    });

    // 1. Stop reading
    stop_sources_.request();
    for (auto& worker : workers_) {
        if (worker->thread && worker->thread->joinable()) {
            worker->thread->join();
        }
        worker->thread.reset();
    }

    // 2. Drain what was read
    ingestion_.close();
    if (join_thread_ && join_thread_->joinable()) {
        join_thread_->join();
    }
    join_thread_.reset();

    stop_checkpoints_.request();
    if (checkpoint_thread_ && checkpoint_thread_->joinable()) {
        checkpoint_thread_->join();
    }
    checkpoint_thread_.reset();

    // 3. Final checkpoint, which also waits for the sink to catch up
    if (!abort_.requested() && !failed()) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0 ||
            !takeCheckpoint(remaining)) {
            std::cerr << "EnrichmentPipeline: final checkpoint not written; restart"
                      << " resumes from the previous one" << std::endl;
        }
    }

    // 4. Flush the sink
    sink_writer_.stop();

    shutdown_complete_.request();
    watchdog.join();
    std::cout << "EnrichmentPipeline: stopped (emitted " << join_.emitted_count()
              << ", delivered " << sink_writer_.deliveredSeq() << ")" << std::endl;
}

bool EnrichmentPipeline::checkpointNow(std::chrono::milliseconds timeout) {
    return takeCheckpoint(timeout);
}

bool EnrichmentPipeline::waitUntilIdle(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (failed()) {
            return false;
        }
        bool drained = true;
        for (const auto& worker : workers_) {
            drained = drained && worker->drained.load();
        }
        if (drained && ingestion_.size() == 0 &&
            batches_pushed_.load() == batches_applied_.load() &&
            sink_writer_.deliveredSeq() >= join_.emitted_count()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}

bool EnrichmentPipeline::failed() const {
    return failed_.load() || sink_writer_.failed();
}

std::string EnrichmentPipeline::failureReason() const {
    std::lock_guard<std::mutex> lock(failure_mutex_);
    if (!failure_reason_.empty()) {
        return failure_reason_;
    }
    return sink_writer_.failureReason();
}

std::map<std::string, int64_t> EnrichmentPipeline::getStats() const {
    std::map<std::string, int64_t> stats;
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        for (const auto& [key, value] : join_stats_) {
            stats["join." + key] = value;
        }
    }
    for (const auto& [key, value] : store_.getStats()) {
        stats["store." + key] = value;
    }
    for (const auto& [key, value] : coordinator_.getStats()) {
        stats["coordinator." + key] = value;
    }
    for (const auto& [key, value] : sink_writer_.getStats()) {
        stats["sink." + key] = value;
    }
    for (const auto& [key, value] : checkpoint_manager_.getStats()) {
        stats["checkpoint." + key] = value;
    }
    for (StreamKind kind : ALL_STREAM_KINDS) {
        const auto& worker = workers_[stream_index(kind)];
        std::string prefix = "source." + stream_kind_to_string(kind) + ".";
        stats[prefix + "batches"] = worker->batches.load();
        stats[prefix + "records"] = worker->records.load();
        stats[prefix + "malformed_records"] = worker->malformed.load();
        stats[prefix + "unavailable_polls"] = worker->unavailable_polls.load();
    }
    stats["pipeline.ingestion_queue_size"] = static_cast<int64_t>(ingestion_.size());
    stats["pipeline.failed"] = failed() ? 1 : 0;
    return stats;
}

// ========== Private Helper Methods ==========

void EnrichmentPipeline::restore() {
    restore_result_ = checkpoint_manager_.restoreLatest();

    if (!restore_result_.checkpoint) {
        for (auto& worker : workers_) {
            worker->adapter->seekToEarliest();
            applied_offsets_[worker->adapter->kind()] = worker->adapter->offsets();
        }
        return;
    }

    const auto& checkpoint = *restore_result_.checkpoint;
    store_.restore(checkpoint.state);
    coordinator_.restore(checkpoint.source_watermarks, checkpoint.global_watermark);

    for (auto& worker : workers_) {
        StreamKind kind = worker->adapter->kind();
        auto offsets = checkpoint.offsets.find(kind);
        auto watermark = checkpoint.source_watermarks.find(kind);
        worker->adapter->seek(
            offsets != checkpoint.offsets.end() ? offsets->second
                                                : std::map<int32_t, int64_t>{},
            watermark != checkpoint.source_watermarks.end() ? watermark->second
                                                            : NO_WATERMARK);
        applied_offsets_[kind] = worker->adapter->offsets();
    }

    join_.set_emitted_count(checkpoint.emitted_seq);
    sink_writer_.resetDelivered(checkpoint.emitted_seq);
    publishJoinStats();

    // Now owned by the state store
    restore_result_.checkpoint->state = compute::StateSnapshot();
}

void EnrichmentPipeline::sourceLoop(SourceWorker* worker) {
    io::SourceAdapter& adapter = *worker->adapter;
    const auto poll_interval = std::chrono::milliseconds(adapter.config().poll_interval_ms);
    int64_t last_watermark = adapter.currentWatermark();
    bool last_available = true;

    while (!stop_sources_.requested()) {
        io::SourceBatch batch = adapter.poll();
        worker->records += static_cast<int64_t>(batch.events.size());
        worker->malformed += static_cast<int64_t>(batch.malformed);
        if (!batch.available) {
            worker->unavailable_polls++;
        }

        bool idle = batch.events.empty();
        bool changed = !idle || batch.malformed > 0 ||
                       batch.watermark != last_watermark ||
                       batch.available != last_available;
        if (changed) {
            last_watermark = batch.watermark;
            last_available = batch.available;
            worker->drained.store(false);
            batches_pushed_++;
            bool pushed = false;
            while (!stop_sources_.requested()) {
                if (ingestion_.push_for(batch, poll_interval)) {
                    pushed = true;
                    break;
                }
                if (ingestion_.closed()) {
                    break;
                }
            }
            if (!pushed) {
                // Never applied, so its offsets are not checkpointed; it is re-read
                batches_pushed_--;
                break;
            }
            worker->batches++;
        }

        if (idle) {
            worker->drained.store(adapter.exhausted());
            stop_sources_.wait_for(poll_interval);
        }
    }
}

void EnrichmentPipeline::joinLoop() {
    while (!abort_.requested()) {
        io::SourceBatch batch;
        if (ingestion_.pop_for(batch, JOIN_POLL_TIMEOUT)) {
            try {
                applyBatch(batch);
            } catch (const std::exception& e) {
                batches_applied_++;
                if (!abort_.requested()) {
                    fail(std::string("join loop: ") + e.what());
                }
                break;
            }
            batches_applied_++;
            publishJoinStats();
        } else if (ingestion_.closed()) {
            break;
        }
        serviceSnapshotRequest();
    }

    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        join_running_.store(false);
    }
    snapshot_cv_.notify_all();
}

void EnrichmentPipeline::checkpointLoop() {
    auto interval = std::chrono::milliseconds(config_.checkpoint.interval_ms);
    while (!stop_checkpoints_.wait_for(interval)) {
        if (failed()) {
            break;
        }
        takeCheckpoint(interval);
    }
}

void EnrichmentPipeline::applyBatch(const io::SourceBatch& batch) {
    coordinator_.reportAvailability(batch.kind, batch.available);
    for (const auto& event : batch.events) {
        join_.process(event);
    }
    applied_offsets_[batch.kind] = batch.offsets;
    if (batch.watermark != NO_WATERMARK) {
        join_.advance_watermark(batch.kind, batch.watermark);
    }
}

void EnrichmentPipeline::emitRecord(const EnrichedRecord& record) {
    if (!sink_writer_.submit(join_.emitted_count(), record)) {
        throw SinkWriteFailed("output queue closed at record " + record.id());
    }
}

void EnrichmentPipeline::serviceSnapshotRequest() {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    if (!snapshot_requested_) {
        return;
    }
    captured_ = captureCheckpoint();
    snapshot_requested_ = false;
    snapshot_cv_.notify_all();
}

compute::Checkpoint EnrichmentPipeline::captureCheckpoint() const {
    compute::Checkpoint checkpoint;
    checkpoint.created_at_ms = current_time_ms();
    checkpoint.offsets = applied_offsets_;
    for (StreamKind kind : ALL_STREAM_KINDS) {
        int64_t watermark = coordinator_.sourceWatermark(kind);
        if (watermark != NO_WATERMARK) {
            checkpoint.source_watermarks[kind] = watermark;
        }
    }
    checkpoint.global_watermark = coordinator_.globalWatermark();
    checkpoint.emitted_seq = join_.emitted_count();
    checkpoint.state = store_.snapshot();
    return checkpoint;
}

bool EnrichmentPipeline::takeCheckpoint(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> serial(checkpoint_mutex_);
    auto deadline = std::chrono::steady_clock::now() + timeout;

    std::optional<compute::Checkpoint> checkpoint;
    {
        std::unique_lock<std::mutex> lock(snapshot_mutex_);
        if (join_running_.load()) {
            snapshot_requested_ = true;
            captured_.reset();
            snapshot_cv_.wait_until(lock, deadline, [this]() {
                return captured_.has_value() || !join_running_.load();
            });
            snapshot_requested_ = false;
            if (captured_) {
                checkpoint = std::move(captured_);
                captured_.reset();
            } else if (join_running_.load()) {
                std::cerr << "EnrichmentPipeline: checkpoint snapshot timed out" << std::endl;
                return false;
            }
        }
    }

    if (!checkpoint) {
        // Join loop stopped: state no longer changes
        if (failed()) {
            return false;
        }
        checkpoint = captureCheckpoint();
    }

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (!sink_writer_.waitDelivered(checkpoint->emitted_seq,
                                    std::max(remaining, std::chrono::milliseconds(0)))) {
        std::cerr << "EnrichmentPipeline: sink has not delivered up to seq "
                  << checkpoint->emitted_seq << " (delivered "
                  << sink_writer_.deliveredSeq() << "), checkpoint deferred" << std::endl;
        return false;
    }

    try {
        checkpoint_manager_.persist(std::move(*checkpoint));
        return true;
    } catch (const CheckpointWriteFailed& e) {
        std::cerr << "EnrichmentPipeline: " << e.what()
                  << "; previous checkpoint stays authoritative" << std::endl;
        return false;
    }
}

void EnrichmentPipeline::fail(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(failure_mutex_);
        if (!failed_.load()) {
            failure_reason_ = reason;
            failed_.store(true);
        }
    }
    std::cerr << "EnrichmentPipeline: CRITICAL " << reason << std::endl;
    stop_sources_.request();
    ingestion_.close();
}

void EnrichmentPipeline::publishJoinStats() {
    auto stats = join_.get_stats();
    std::lock_guard<std::mutex> lock(stats_mutex_);
    join_stats_ = std::move(stats);
}

} // namespace shopstream
