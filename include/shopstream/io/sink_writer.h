/**
 * @file sink_writer.h
 * @brief Batching, retrying writer from the join output to the upsert sink
 */

#pragma once

#include "shopstream/core/records.h"
#include "shopstream/io/dead_letter.h"
#include "shopstream/io/upsert_sink.h"
#include "shopstream/utils/bounded_queue.h"
#include "shopstream/utils/config.h"
#include "shopstream/utils/shutdown_signal.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace shopstream {
namespace io {

/**
 * @brief A finalized record with its emission sequence number
 */
struct OutputRecord {
    uint64_t seq = 0;
    EnrichedRecord record;
};

/**
 * @brief Upsert sink writer
 *
 * Consumes a bounded output queue on its own thread. Records are batched
 * until batch_size is reached or batch_interval has passed since the first
 * record of the batch. Documents rejected by the sink are retried with
 * exponential backoff; after max_retry_attempts retries they go to the
 * dead-letter output. Overflowing dead_letter_capacity is fatal.
 *
 * deliveredSeq() is the highest emission sequence number up to which every
 * record is either in the sink or dead-lettered. Checkpoints wait on it.
 *
 * Usage:
 * 1. Construct with sink and dead-letter output
 * 2. start()
 * 3. submit() from the join loop (blocks while the queue is full)
 * 4. stop() drains the queue and joins the thread
 */
class UpsertSinkWriter {
public:
    UpsertSinkWriter(const SinkWriterConfig& config,
                     UpsertSink* sink,
                     DeadLetterOutput* dead_letter,
                     ShutdownSignal* abort_signal = nullptr);

    ~UpsertSinkWriter();

    bool start();

    /**
     * @brief Close the queue, deliver what is queued and join the thread
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    /**
     * @brief Queue a record; blocks while the output queue is full
     * @return false if the writer is stopped or failed
     */
    bool submit(uint64_t seq, const EnrichedRecord& record);

    uint64_t deliveredSeq() const { return delivered_seq_.load(); }

    /**
     * @brief Mark everything up to seq delivered (used after a restore)
     */
    void resetDelivered(uint64_t seq);

    /**
     * @brief Wait until deliveredSeq() >= seq
     * @return false on timeout, failure or stop before reaching seq
     */
    bool waitDelivered(uint64_t seq, std::chrono::milliseconds timeout);

    /**
     * @brief Deliver one batch synchronously
     * @return false if an abort interrupted the retries (nothing dead-lettered)
     * @throws SinkWriteFailed if the dead-letter capacity is exceeded
     */
    bool writeBatch(const std::vector<OutputRecord>& batch);

    /**
     * @brief Set once a fatal error stopped the writer
     */
    bool failed() const { return failed_.load(); }
    std::string failureReason() const;

    size_t queuedCount() const { return queue_.size(); }

    std::map<std::string, int64_t> getStats() const;

private:
    void writerLoop();
    void markDelivered(uint64_t seq);
    void deadLetter(const SinkDocument& doc, const std::string& error, int attempts);

    SinkWriterConfig config_;
    UpsertSink* sink_;
    DeadLetterOutput* dead_letter_;
    ShutdownSignal* abort_signal_;

    BoundedQueue<OutputRecord> queue_;
    std::unique_ptr<std::thread> writer_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> failed_{false};
    std::string failure_reason_;

    std::atomic<uint64_t> delivered_seq_{0};
    mutable std::mutex delivered_mutex_;
    std::condition_variable delivered_cv_;

    // Statistics
    std::atomic<int64_t> documents_written_{0};
    std::atomic<int64_t> batches_written_{0};
    std::atomic<int64_t> retries_{0};
    std::atomic<int64_t> dead_lettered_{0};
};

} // namespace io
} // namespace shopstream
