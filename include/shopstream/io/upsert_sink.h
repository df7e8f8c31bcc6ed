/**
 * @file upsert_sink.h
 * @brief Idempotent document sinks keyed by document id
 */

#pragma once

#include <cstdint>
#include <fstream>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace shopstream {
namespace io {

/**
 * @brief Document to upsert; body is a serialized JSON object
 */
struct SinkDocument {
    std::string id;
    std::string body;
};

struct DocumentFailure {
    std::string id;
    std::string error;
};

/**
 * @brief Per-document outcome of a put
 */
struct UpsertResponse {
    std::vector<DocumentFailure> failures;

    bool ok() const { return failures.empty(); }
};

/**
 * @brief Upsert sink
 *
 * put() writes every document under its id, replacing any earlier version,
 * so writing the same document twice leaves one copy. Documents missing
 * from `failures` are durable when put() returns.
 */
class UpsertSink {
public:
    virtual ~UpsertSink() = default;

    /**
     * @throws SinkWriteFailed when the request as a whole fails
     */
    virtual UpsertResponse put(const std::string& index,
                               const std::vector<SinkDocument>& documents) = 0;
};

/**
 * @brief In-memory sink with failure injection
 */
class InMemoryUpsertSink : public UpsertSink {
public:
    UpsertResponse put(const std::string& index,
                       const std::vector<SinkDocument>& documents) override;

    /**
     * @brief Make the next `count` puts throw SinkWriteFailed
     */
    void failNextPuts(int count);

    /**
     * @brief Reject a document id `times` times (-1: always)
     */
    void rejectDocument(const std::string& id, int times = -1);

    std::optional<std::string> document(const std::string& index,
                                        const std::string& id) const;
    std::map<std::string, std::string> documents(const std::string& index) const;
    size_t documentCount(const std::string& index) const;

    /**
     * @brief Successful writes of one id (overwrites included)
     */
    int64_t writeCount(const std::string& id) const;

    int64_t putCount() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::map<std::string, std::string>> indices_;
    std::map<std::string, int64_t> write_counts_;
    std::map<std::string, int> rejections_;
    int fail_next_ = 0;
    int64_t put_count_ = 0;
};

/**
 * @brief Appends `{"index","id","document"}` lines to a file
 *
 * An append-only log of upserts: the last line for an id is its current
 * version.
 */
class NdjsonFileSink : public UpsertSink {
public:
    explicit NdjsonFileSink(const std::string& path);

    UpsertResponse put(const std::string& index,
                       const std::vector<SinkDocument>& documents) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::ofstream out_;
    std::mutex mutex_;
};

} // namespace io
} // namespace shopstream
