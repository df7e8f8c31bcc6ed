/**
 * @file dead_letter.h
 * @brief Destination for documents the sink would not accept
 */

#pragma once

#include <cstddef>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace shopstream {
namespace io {

struct DeadLetterEntry {
    std::string id;
    std::string document;
    std::string error;     ///< Last failure reported by the sink
    int attempts = 0;
};

class DeadLetterOutput {
public:
    virtual ~DeadLetterOutput() = default;

    /**
     * @throws std::runtime_error if the entry cannot be recorded
     */
    virtual void write(const DeadLetterEntry& entry) = 0;

    virtual size_t count() const = 0;
};

class InMemoryDeadLetterOutput : public DeadLetterOutput {
public:
    void write(const DeadLetterEntry& entry) override;
    size_t count() const override;
    std::vector<DeadLetterEntry> entries() const;

private:
    mutable std::mutex mutex_;
    std::vector<DeadLetterEntry> entries_;
};

/**
 * @brief One JSON object per line: id, document, error, attempts
 */
class NdjsonDeadLetterOutput : public DeadLetterOutput {
public:
    explicit NdjsonDeadLetterOutput(const std::string& path);

    void write(const DeadLetterEntry& entry) override;
    size_t count() const override;

private:
    std::string path_;
    std::ofstream out_;
    size_t count_ = 0;
    mutable std::mutex mutex_;
};

} // namespace io
} // namespace shopstream
