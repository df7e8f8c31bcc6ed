#include "shopstream/io/sink_writer.h"
#include "shopstream/core/errors.h"
#include "shopstream/core/record_codec.h"
#include <iostream>
#include <stdexcept>

namespace shopstream {
namespace io {

UpsertSinkWriter::UpsertSinkWriter(const SinkWriterConfig& config,
                                   UpsertSink* sink,
                                   DeadLetterOutput* dead_letter,
                                   ShutdownSignal* abort_signal)
    : config_(config),
      sink_(sink),
      dead_letter_(dead_letter),
      abort_signal_(abort_signal),
      queue_(config.output_queue_capacity) {
    if (!sink_ || !dead_letter_) {
        throw std::invalid_argument("UpsertSinkWriter: null pointer arguments");
    }
    if (config_.batch_size == 0) {
        throw std::invalid_argument("UpsertSinkWriter: batch_size must be > 0");
    }
    if (config_.max_retry_attempts < 0) {
        throw std::invalid_argument("UpsertSinkWriter: max_retry_attempts must be >= 0");
    }
}

UpsertSinkWriter::~UpsertSinkWriter() {
    stop();
}

bool UpsertSinkWriter::start() {
    if (running_.load()) {
        std::cerr << "UpsertSinkWriter: already running" << std::endl;
        return false;
    }
    running_.store(true);
    writer_thread_ = std::make_unique<std::thread>(&UpsertSinkWriter::writerLoop, this);
    std::cout << "UpsertSinkWriter: started (index=" << config_.index
              << ", batch=" << config_.batch_size
              << ", interval=" << config_.batch_interval_ms << "ms)" << std::endl;
    return true;
}

void UpsertSinkWriter::stop() {
    queue_.close();
    if (!writer_thread_) {
        return;
    }
    if (writer_thread_->joinable()) {
        writer_thread_->join();
    }
    writer_thread_.reset();
    running_.store(false);
    delivered_cv_.notify_all();
    std::cout << "UpsertSinkWriter: stopped (delivered seq " << deliveredSeq() << ")"
              << std::endl;
}

bool UpsertSinkWriter::submit(uint64_t seq, const EnrichedRecord& record) {
    if (failed_.load()) {
        return false;
    }
    return queue_.push(OutputRecord{seq, record});
}

void UpsertSinkWriter::resetDelivered(uint64_t seq) {
    {
        std::lock_guard<std::mutex> lock(delivered_mutex_);
        delivered_seq_.store(seq);
    }
    delivered_cv_.notify_all();
}

bool UpsertSinkWriter::waitDelivered(uint64_t seq, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(delivered_mutex_);
    delivered_cv_.wait_for(lock, timeout, [this, seq]() {
        return delivered_seq_.load() >= seq || failed_.load() ||
               (!running_.load() && queue_.closed());
    });
    return delivered_seq_.load() >= seq;
}

bool UpsertSinkWriter::writeBatch(const std::vector<OutputRecord>& batch) {
    if (batch.empty()) {
        return true;
    }

    std::vector<SinkDocument> remaining;
    remaining.reserve(batch.size());
    for (const auto& item : batch) {
        remaining.push_back({item.record.id(), encode_enriched(item.record)});
    }

    std::map<std::string, std::string> last_errors;
    int attempts = 0;
    for (int attempt = 0; attempt <= config_.max_retry_attempts; ++attempt) {
        if (attempt > 0) {
            retries_++;
            auto delay = backoff_delay(config_.retry_backoff_ms, attempt - 1);
            if (abort_signal_) {
                if (abort_signal_->wait_for(delay)) {
                    std::cerr << "UpsertSinkWriter: aborted with " << remaining.size()
                              << " undelivered documents" << std::endl;
                    return false;
                }
            } else {
                std::this_thread::sleep_for(delay);
            }
        }
        attempts++;

        std::vector<SinkDocument> failed_docs;
        try {
            UpsertResponse response = sink_->put(config_.index, remaining);
            std::map<std::string, std::string> failed_ids;
            for (const auto& failure : response.failures) {
                failed_ids[failure.id] = failure.error;
            }
            for (const auto& doc : remaining) {
                auto it = failed_ids.find(doc.id);
                if (it == failed_ids.end()) {
                    documents_written_++;
                } else {
                    last_errors[doc.id] = it->second;
                    failed_docs.push_back(doc);
                }
            }
        } catch (const SinkWriteFailed& e) {
            for (const auto& doc : remaining) {
                last_errors[doc.id] = e.what();
            }
            failed_docs = remaining;
        }

        remaining = std::move(failed_docs);
        if (remaining.empty()) {
            break;
        }
    }

    for (const auto& doc : remaining) {
        deadLetter(doc, last_errors[doc.id], attempts);
    }

    batches_written_++;
    markDelivered(batch.back().seq);
    return true;
}

std::string UpsertSinkWriter::failureReason() const {
    std::lock_guard<std::mutex> lock(delivered_mutex_);
    return failure_reason_;
}

std::map<std::string, int64_t> UpsertSinkWriter::getStats() const {
    return {
        {"documents_written", documents_written_.load()},
        {"batches_written", batches_written_.load()},
        {"sink_retries", retries_.load()},
        {"dead_lettered", dead_lettered_.load()},
        {"delivered_seq", static_cast<int64_t>(delivered_seq_.load())},
        {"output_queue_size", static_cast<int64_t>(queue_.size())}
    };
}

// ========== Private Helper Methods ==========

void UpsertSinkWriter::writerLoop() {
    auto interval = std::chrono::milliseconds(config_.batch_interval_ms);
    std::vector<OutputRecord> batch;
    batch.reserve(config_.batch_size);

    while (true) {
        OutputRecord item;
        if (!queue_.pop(item)) {
            break;  // closed and drained
        }
        batch.push_back(std::move(item));

        auto batch_deadline = std::chrono::steady_clock::now() + interval;
        while (batch.size() < config_.batch_size) {
            auto now = std::chrono::steady_clock::now();
            if (now >= batch_deadline) {
                break;
            }
            if (!queue_.pop_for(item, batch_deadline - now)) {
                if (queue_.closed() && queue_.size() == 0) {
                    break;
                }
                continue;
            }
            batch.push_back(std::move(item));
        }

        try {
            if (!writeBatch(batch)) {
                // Aborted; the rest is recovered by replay
                queue_.close();
                break;
            }
        } catch (const std::exception& e) {
            {
                std::lock_guard<std::mutex> lock(delivered_mutex_);
                failure_reason_ = e.what();
                failed_.store(true);
            }
            std::cerr << "UpsertSinkWriter: CRITICAL " << e.what() << std::endl;
            queue_.close();
            delivered_cv_.notify_all();
            break;
        }
        batch.clear();
    }
    running_.store(false);
    delivered_cv_.notify_all();
}

void UpsertSinkWriter::markDelivered(uint64_t seq) {
    {
        std::lock_guard<std::mutex> lock(delivered_mutex_);
        if (seq > delivered_seq_.load()) {
            delivered_seq_.store(seq);
        }
    }
    delivered_cv_.notify_all();
}

void UpsertSinkWriter::deadLetter(const SinkDocument& doc, const std::string& error,
                                  int attempts) {
    if (static_cast<size_t>(dead_lettered_.load()) >= config_.dead_letter_capacity) {
        throw SinkWriteFailed("dead-letter capacity of " +
                              std::to_string(config_.dead_letter_capacity) +
                              " exceeded at document " + doc.id);
    }
    dead_letter_->write({doc.id, doc.body, error, attempts});
    dead_lettered_++;
    std::cerr << "UpsertSinkWriter: dead-lettered " << doc.id << " after " << attempts
              << " attempts: " << error << std::endl;
}

} // namespace io
} // namespace shopstream
