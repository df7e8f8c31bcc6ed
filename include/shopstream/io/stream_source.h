/**
 * @file stream_source.h
 * @brief Partitioned, offset-addressed input logs
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace shopstream {
namespace io {

/**
 * @brief One raw message read from a partition
 */
struct SourceMessage {
    int32_t partition = 0;
    int64_t offset = 0;
    std::string payload;
};

/**
 * @brief Partitioned log with per-partition ordering
 *
 * Delivery is at-least-once: after a restart the reader is positioned at
 * checkpointed offsets and re-reads everything after them.
 */
class PartitionedStreamSource {
public:
    virtual ~PartitionedStreamSource() = default;

    virtual std::vector<int32_t> partitions() const = 0;

    /**
     * @brief Position a partition so the next fetch returns `offset` first
     */
    virtual void seek(int32_t partition, int64_t offset) = 0;

    /**
     * @brief Read up to max_per_partition messages from every partition
     * @throws SourceUnavailable on read failure
     */
    virtual std::vector<SourceMessage> fetch(size_t max_per_partition) = 0;

    virtual int64_t earliestOffset(int32_t partition) const {
        (void)partition;
        return 0;
    }

    /**
     * @brief True once a finite source has been read to its end
     */
    virtual bool exhausted() const { return false; }
};

/**
 * @brief Thread-safe in-memory log
 *
 * Messages can be appended while a reader is fetching. Failure injection
 * makes the next fetches throw SourceUnavailable.
 */
class InMemoryStreamSource : public PartitionedStreamSource {
public:
    explicit InMemoryStreamSource(int32_t partition_count = 1);

    /**
     * @brief Append a payload
     * @return Offset of the new message
     */
    int64_t append(int32_t partition, const std::string& payload);
    int64_t append(const std::string& payload) { return append(0, payload); }

    /**
     * @brief Mark the log finished; exhausted() turns true once all is read
     */
    void close();

    /**
     * @brief Make the next `count` fetches fail
     */
    void failNextFetches(int count);

    /**
     * @brief Fail every fetch until cleared
     */
    void setUnavailable(bool unavailable);

    int64_t fetchCount() const;
    size_t size(int32_t partition) const;

    std::vector<int32_t> partitions() const override;
    void seek(int32_t partition, int64_t offset) override;
    std::vector<SourceMessage> fetch(size_t max_per_partition) override;
    bool exhausted() const override;

private:
    mutable std::mutex mutex_;
    std::vector<std::vector<std::string>> logs_;
    std::vector<int64_t> positions_;
    bool closed_ = false;
    int fail_next_ = 0;
    bool unavailable_ = false;
    int64_t fetch_count_ = 0;
};

/**
 * @brief Newline-delimited JSON files, one file per partition
 *
 * The offset of a message is its zero-based line number. Without `follow`
 * the source is exhausted at end of file; with it, the files are tailed.
 * When following, a trailing line without its newline is not consumed
 * until completed.
 */
class NdjsonFileSource : public PartitionedStreamSource {
public:
    explicit NdjsonFileSource(std::vector<std::string> paths, bool follow = false);

    std::vector<int32_t> partitions() const override;
    void seek(int32_t partition, int64_t offset) override;
    std::vector<SourceMessage> fetch(size_t max_per_partition) override;
    bool exhausted() const override;

private:
    struct PartitionReader {
        std::string path;
        std::unique_ptr<std::ifstream> stream;
        int64_t next_offset = 0;
        bool at_end = false;
    };

    void open(PartitionReader& reader);

    std::vector<PartitionReader> readers_;
    bool follow_;
};

} // namespace io
} // namespace shopstream
