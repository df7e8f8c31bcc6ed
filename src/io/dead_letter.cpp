#include "shopstream/io/dead_letter.h"
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace shopstream {
namespace io {

void InMemoryDeadLetterOutput::write(const DeadLetterEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(entry);
}

size_t InMemoryDeadLetterOutput::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::vector<DeadLetterEntry> InMemoryDeadLetterOutput::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

NdjsonDeadLetterOutput::NdjsonDeadLetterOutput(const std::string& path)
    : path_(path), out_(path, std::ios::app) {
    if (!out_.is_open()) {
        throw std::runtime_error("NdjsonDeadLetterOutput: cannot open " + path);
    }
}

void NdjsonDeadLetterOutput::write(const DeadLetterEntry& entry) {
    nlohmann::json line;
    line["id"] = entry.id;
    // Keep the document as text: it may be what the sink refused to parse
    line["document"] = entry.document;
    line["error"] = entry.error;
    line["attempts"] = entry.attempts;

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line.dump() << '\n';
    out_.flush();
    if (!out_) {
        out_.clear();
        throw std::runtime_error("NdjsonDeadLetterOutput: write to " + path_ + " failed");
    }
    count_++;
}

size_t NdjsonDeadLetterOutput::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

} // namespace io
} // namespace shopstream
