#pragma once

#include "shopstream/compute/keyed_state_store.h"
#include "shopstream/core/records.h"
#include "shopstream/io/checkpoint_store.h"
#include "shopstream/utils/config.h"
#include "shopstream/utils/shutdown_signal.h"
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace shopstream {
namespace compute {

/**
 * @brief Everything needed to resume the pipeline
 *
 * Offsets are the next offsets to read per partition, consistent with the
 * state snapshot: every record before them is reflected in `state`, none
 * after them is.
 */
struct Checkpoint {
    uint64_t version = 0;                 ///< Assigned by persist()
    int64_t created_at_ms = 0;
    std::map<StreamKind, std::map<int32_t, int64_t>> offsets;
    std::map<StreamKind, int64_t> source_watermarks;
    int64_t global_watermark = NO_WATERMARK;
    uint64_t emitted_seq = 0;             ///< Last emission covered by this checkpoint
    StateSnapshot state;
};

/**
 * @brief Outcome of a restore attempt
 */
struct RestoreResult {
    std::optional<Checkpoint> checkpoint;   ///< Empty: cold start
    size_t corrupt_versions = 0;            ///< Versions skipped as unreadable
    bool data_loss = false;                 ///< Checkpoints existed but none was valid
};

/**
 * @brief Checkpoint manager
 *
 * Serializes checkpoints into a self-validating binary payload and
 * persists them through a CheckpointStore:
 * - The payload is written as a new immutable version
 * - The LATEST pointer is published only after the payload write succeeded
 * - Older versions beyond retain_count are deleted
 *
 * Restore tries LATEST, then older versions newest first; a payload that
 * fails validation is skipped. Thread-safe.
 *
 * Payload layout (native byte order):
 *   [magic:4][format_version:4][body...][fnv1a64(magic..body):8]
 */
class CheckpointManager {
public:
    static constexpr uint32_t MAGIC = 0x4B435353;   // "SSCK"
    static constexpr uint32_t FORMAT_VERSION = 2;

    /**
     * @param store Checkpoint store (not owned)
     * @param config Retention and retry settings
     * @param abort_signal Interrupts retry backoff (optional)
     */
    CheckpointManager(io::CheckpointStore* store,
                      const CheckpointConfig& config,
                      ShutdownSignal* abort_signal = nullptr);

    /**
     * @brief Persist a checkpoint as the next version
     * @return The version written
     * @throws CheckpointWriteFailed once all attempts failed; the previous
     *         checkpoint stays authoritative
     */
    uint64_t persist(Checkpoint checkpoint);

    /**
     * @brief Load the newest valid checkpoint
     */
    RestoreResult restoreLatest();

    /**
     * @brief Load one version
     * @throws CheckpointCorrupt if missing or invalid
     */
    Checkpoint load(uint64_t version) const;

    static std::vector<uint8_t> serialize(const Checkpoint& checkpoint);

    /**
     * @throws CheckpointCorrupt on any validation failure
     */
    static Checkpoint deserialize(const std::vector<uint8_t>& data);

    static uint64_t fnv1a(const uint8_t* data, size_t size);

    std::map<std::string, int64_t> getStats() const;

private:
    void applyRetention(uint64_t latest);

    io::CheckpointStore* store_;
    CheckpointConfig config_;
    ShutdownSignal* abort_signal_;
    mutable std::mutex mutex_;

    // Statistics
    std::atomic<int64_t> checkpoints_written_{0};
    std::atomic<int64_t> write_failures_{0};
    std::atomic<int64_t> last_version_{0};
    std::atomic<int64_t> last_size_bytes_{0};
    std::atomic<int64_t> corrupt_skipped_{0};
};

} // namespace compute
} // namespace shopstream
