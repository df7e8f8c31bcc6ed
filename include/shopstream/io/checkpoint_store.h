/**
 * @file checkpoint_store.h
 * @brief Versioned storage for checkpoint payloads
 */

#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace shopstream {
namespace io {

/**
 * @brief Checkpoint store
 *
 * Payloads are immutable once written and addressed by version. A single
 * LATEST pointer names the checkpoint to restore from; it is published
 * only after the payload is durable.
 */
class CheckpointStore {
public:
    virtual ~CheckpointStore() = default;

    /**
     * @brief Write a payload unless that version already exists
     * @return false if the version exists (nothing written)
     * @throws CheckpointWriteFailed on I/O failure
     */
    virtual bool writePayload(uint64_t version, const std::vector<uint8_t>& payload) = 0;

    /**
     * @throws CheckpointWriteFailed on I/O failure
     */
    virtual void publishLatest(uint64_t version) = 0;

    virtual std::optional<uint64_t> latestVersion() const = 0;

    /**
     * @brief Stored versions, ascending
     */
    virtual std::vector<uint64_t> listVersions() const = 0;

    virtual std::optional<std::vector<uint8_t>> readPayload(uint64_t version) const = 0;

    virtual bool deleteVersion(uint64_t version) = 0;
};

/**
 * @brief Directory-backed store
 *
 * Layout:
 *   <dir>/checkpoint_<version>.ckpt   immutable payloads
 *   <dir>/LATEST                      decimal version of the latest checkpoint
 *
 * Both are written to a temporary file that is fsynced before it is
 * renamed into place; the directory is fsynced after the rename.
 */
class FileCheckpointStore : public CheckpointStore {
public:
    explicit FileCheckpointStore(const std::string& directory);

    bool writePayload(uint64_t version, const std::vector<uint8_t>& payload) override;
    void publishLatest(uint64_t version) override;
    std::optional<uint64_t> latestVersion() const override;
    std::vector<uint64_t> listVersions() const override;
    std::optional<std::vector<uint8_t>> readPayload(uint64_t version) const override;
    bool deleteVersion(uint64_t version) override;

    std::string getPayloadPath(uint64_t version) const;
    const std::string& directory() const { return directory_; }

private:
    void writeFileAtomically(const std::string& path, const char* data, size_t size);

    std::string directory_;
};

/**
 * @brief In-memory store with failure injection
 */
class InMemoryCheckpointStore : public CheckpointStore {
public:
    bool writePayload(uint64_t version, const std::vector<uint8_t>& payload) override;
    void publishLatest(uint64_t version) override;
    std::optional<uint64_t> latestVersion() const override;
    std::vector<uint64_t> listVersions() const override;
    std::optional<std::vector<uint8_t>> readPayload(uint64_t version) const override;
    bool deleteVersion(uint64_t version) override;

    void failNextWrites(int count);
    void failNextPublishes(int count);

    /**
     * @brief Replace a stored payload, bypassing immutability
     */
    void overwritePayload(uint64_t version, const std::vector<uint8_t>& payload);

private:
    mutable std::mutex mutex_;
    std::map<uint64_t, std::vector<uint8_t>> payloads_;
    std::optional<uint64_t> latest_;
    int fail_writes_ = 0;
    int fail_publishes_ = 0;
};

} // namespace io
} // namespace shopstream
