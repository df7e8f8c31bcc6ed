#include "shopstream/io/upsert_sink.h"
#include "shopstream/core/errors.h"
#include <nlohmann/json.hpp>

namespace shopstream {
namespace io {

// ========== InMemoryUpsertSink ==========

UpsertResponse InMemoryUpsertSink::put(const std::string& index,
                                       const std::vector<SinkDocument>& documents) {
    std::lock_guard<std::mutex> lock(mutex_);
    put_count_++;
    if (fail_next_ > 0) {
        fail_next_--;
        throw SinkWriteFailed("injected put failure");
    }

    UpsertResponse response;
    auto& target = indices_[index];
    for (const auto& doc : documents) {
        auto it = rejections_.find(doc.id);
        if (it != rejections_.end() && it->second != 0) {
            if (it->second > 0) {
                it->second--;
            }
            response.failures.push_back({doc.id, "injected document rejection"});
            continue;
        }
        target[doc.id] = doc.body;
        write_counts_[doc.id]++;
    }
    return response;
}

void InMemoryUpsertSink::failNextPuts(int count) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_next_ = count;
}

void InMemoryUpsertSink::rejectDocument(const std::string& id, int times) {
    std::lock_guard<std::mutex> lock(mutex_);
    rejections_[id] = times;
}

std::optional<std::string> InMemoryUpsertSink::document(const std::string& index,
                                                        const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto idx = indices_.find(index);
    if (idx == indices_.end()) {
        return std::nullopt;
    }
    auto it = idx->second.find(id);
    if (it == idx->second.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::string, std::string> InMemoryUpsertSink::documents(
    const std::string& index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto idx = indices_.find(index);
    if (idx == indices_.end()) {
        return {};
    }
    return idx->second;
}

size_t InMemoryUpsertSink::documentCount(const std::string& index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto idx = indices_.find(index);
    return idx == indices_.end() ? 0 : idx->second.size();
}

int64_t InMemoryUpsertSink::writeCount(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = write_counts_.find(id);
    return it == write_counts_.end() ? 0 : it->second;
}

int64_t InMemoryUpsertSink::putCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return put_count_;
}

// ========== NdjsonFileSink ==========

NdjsonFileSink::NdjsonFileSink(const std::string& path)
    : path_(path), out_(path, std::ios::app) {
    if (!out_.is_open()) {
        throw std::runtime_error("NdjsonFileSink: cannot open " + path);
    }
}

UpsertResponse NdjsonFileSink::put(const std::string& index,
                                   const std::vector<SinkDocument>& documents) {
    std::lock_guard<std::mutex> lock(mutex_);
    UpsertResponse response;
    for (const auto& doc : documents) {
        nlohmann::json line;
        line["index"] = index;
        line["id"] = doc.id;
        try {
            line["document"] = nlohmann::json::parse(doc.body);
        } catch (const nlohmann::json::exception& e) {
            response.failures.push_back({doc.id, std::string("invalid document: ") + e.what()});
            continue;
        }
        out_ << line.dump() << '\n';
    }
    out_.flush();
    if (!out_) {
        out_.clear();
        throw SinkWriteFailed("write to " + path_ + " failed");
    }
    return response;
}

} // namespace io
} // namespace shopstream
