#include "shopstream/io/stream_source.h"
#include "shopstream/core/errors.h"
#include <algorithm>
#include <stdexcept>

namespace shopstream {
namespace io {

// ========== InMemoryStreamSource ==========

InMemoryStreamSource::InMemoryStreamSource(int32_t partition_count) {
    if (partition_count <= 0) {
        throw std::invalid_argument("InMemoryStreamSource: partition_count must be > 0");
    }
    logs_.resize(partition_count);
    positions_.assign(partition_count, 0);
}

int64_t InMemoryStreamSource::append(int32_t partition, const std::string& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (partition < 0 || partition >= static_cast<int32_t>(logs_.size())) {
        throw std::out_of_range("InMemoryStreamSource: no partition " +
                                std::to_string(partition));
    }
    logs_[partition].push_back(payload);
    return static_cast<int64_t>(logs_[partition].size()) - 1;
}

void InMemoryStreamSource::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
}

void InMemoryStreamSource::failNextFetches(int count) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_next_ = count;
}

void InMemoryStreamSource::setUnavailable(bool unavailable) {
    std::lock_guard<std::mutex> lock(mutex_);
    unavailable_ = unavailable;
}

int64_t InMemoryStreamSource::fetchCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fetch_count_;
}

size_t InMemoryStreamSource::size(int32_t partition) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return logs_.at(partition).size();
}

std::vector<int32_t> InMemoryStreamSource::partitions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<int32_t> result;
    for (size_t i = 0; i < logs_.size(); ++i) {
        result.push_back(static_cast<int32_t>(i));
    }
    return result;
}

void InMemoryStreamSource::seek(int32_t partition, int64_t offset) {
    std::lock_guard<std::mutex> lock(mutex_);
    positions_.at(partition) = std::max<int64_t>(0, offset);
}

std::vector<SourceMessage> InMemoryStreamSource::fetch(size_t max_per_partition) {
    std::lock_guard<std::mutex> lock(mutex_);
    fetch_count_++;
    if (unavailable_) {
        throw SourceUnavailable("in-memory source marked unavailable");
    }
    if (fail_next_ > 0) {
        fail_next_--;
        throw SourceUnavailable("injected fetch failure");
    }

    std::vector<SourceMessage> messages;
    for (size_t p = 0; p < logs_.size(); ++p) {
        const auto& log = logs_[p];
        int64_t& position = positions_[p];
        size_t taken = 0;
        while (taken < max_per_partition && position < static_cast<int64_t>(log.size())) {
            messages.push_back({static_cast<int32_t>(p), position, log[position]});
            position++;
            taken++;
        }
    }
    return messages;
}

bool InMemoryStreamSource::exhausted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!closed_) {
        return false;
    }
    for (size_t p = 0; p < logs_.size(); ++p) {
        if (positions_[p] < static_cast<int64_t>(logs_[p].size())) {
            return false;
        }
    }
    return true;
}

// ========== NdjsonFileSource ==========

NdjsonFileSource::NdjsonFileSource(std::vector<std::string> paths, bool follow)
    : follow_(follow) {
    if (paths.empty()) {
        throw std::invalid_argument("NdjsonFileSource: at least one file is required");
    }
    for (auto& path : paths) {
        PartitionReader reader;
        reader.path = std::move(path);
        readers_.push_back(std::move(reader));
    }
}

std::vector<int32_t> NdjsonFileSource::partitions() const {
    std::vector<int32_t> result;
    for (size_t i = 0; i < readers_.size(); ++i) {
        result.push_back(static_cast<int32_t>(i));
    }
    return result;
}

void NdjsonFileSource::open(PartitionReader& reader) {
    reader.stream = std::make_unique<std::ifstream>(reader.path);
    if (!reader.stream->is_open()) {
        reader.stream.reset();
        throw SourceUnavailable("cannot open " + reader.path);
    }
    reader.next_offset = 0;
    reader.at_end = false;
}

void NdjsonFileSource::seek(int32_t partition, int64_t offset) {
    auto& reader = readers_.at(partition);
    open(reader);
    std::string line;
    while (reader.next_offset < offset) {
        reader.stream->clear();
        std::streampos start = reader.stream->tellg();
        if (!std::getline(*reader.stream, line) || (reader.stream->eof() && follow_)) {
            // Fewer lines than the checkpoint remembers; resume from here
            reader.stream->clear();
            reader.stream->seekg(start);
            break;
        }
        reader.next_offset++;
    }
}

std::vector<SourceMessage> NdjsonFileSource::fetch(size_t max_per_partition) {
    std::vector<SourceMessage> messages;
    for (size_t p = 0; p < readers_.size(); ++p) {
        auto& reader = readers_[p];
        if (!reader.stream) {
            open(reader);
        }
        reader.at_end = false;

        std::string line;
        size_t taken = 0;
        while (taken < max_per_partition) {
            reader.stream->clear();
            std::streampos start = reader.stream->tellg();
            if (!std::getline(*reader.stream, line)) {
                reader.stream->clear();
                reader.stream->seekg(start);
                reader.at_end = true;
                break;
            }
            if (reader.stream->eof() && follow_) {
                // Incomplete last line; a writer may still be appending
                reader.stream->clear();
                reader.stream->seekg(start);
                reader.at_end = true;
                break;
            }
            if (reader.stream->bad()) {
                throw SourceUnavailable("read error on " + reader.path);
            }

            int64_t offset = reader.next_offset++;
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.find_first_not_of(" \t") == std::string::npos) {
                continue;  // blank lines keep their offset but carry no record
            }
            messages.push_back({static_cast<int32_t>(p), offset, line});
            taken++;
        }
    }
    return messages;
}

bool NdjsonFileSource::exhausted() const {
    if (follow_) {
        return false;
    }
    for (const auto& reader : readers_) {
        if (!reader.at_end) {
            return false;
        }
    }
    return true;
}

} // namespace io
} // namespace shopstream
