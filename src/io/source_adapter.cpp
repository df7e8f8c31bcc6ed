#include "shopstream/io/source_adapter.h"
#include "shopstream/core/errors.h"
#include "shopstream/core/record_codec.h"
#include <iostream>
#include <stdexcept>
#include <thread>

namespace shopstream {
namespace io {

SourceAdapter::SourceAdapter(StreamKind kind,
                             std::unique_ptr<PartitionedStreamSource> source,
                             const SourceConfig& config,
                             ShutdownSignal* shutdown)
    : kind_(kind),
      source_(std::move(source)),
      config_(config),
      shutdown_(shutdown) {
    if (!source_) {
        throw std::invalid_argument("SourceAdapter: source is required");
    }
    if (config_.poll_batch_size == 0) {
        throw std::invalid_argument("SourceAdapter: poll_batch_size must be > 0");
    }
    if (config_.retry_attempts < 1) {
        throw std::invalid_argument("SourceAdapter: retry_attempts must be >= 1");
    }
    for (int32_t partition : source_->partitions()) {
        offsets_[partition] = source_->earliestOffset(partition);
    }
}

SourceBatch SourceAdapter::poll() {
    SourceBatch batch;
    batch.kind = kind_;

    std::vector<SourceMessage> messages;
    bool fetched = false;
    for (int attempt = 0; attempt < config_.retry_attempts; ++attempt) {
        try {
            messages = source_->fetch(config_.poll_batch_size);
            fetched = true;
            break;
        } catch (const SourceUnavailable& e) {
            batch.error = e.what();
        }

        if (attempt + 1 < config_.retry_attempts) {
            read_retries_++;
            auto delay = backoff_delay(config_.retry_backoff_ms, attempt);
            if (shutdown_ && shutdown_->wait_for(delay)) {
                break;
            }
            if (!shutdown_) {
                std::this_thread::sleep_for(delay);
            }
        }
    }

    if (!fetched) {
        failed_polls_++;
        batch.available = false;
        batch.watermark = watermark_;
        batch.offsets = offsets_;
        std::cerr << "SourceAdapter[" << stream_kind_to_string(kind_)
                  << "]: source unavailable: " << batch.error << std::endl;
        return batch;
    }

    batch.events.reserve(messages.size());
    for (const auto& message : messages) {
        offsets_[message.partition] = message.offset + 1;
        StreamEvent event;
        if (!decode(message, event)) {
            batch.malformed++;
            continue;
        }
        if (max_event_time_ == NO_WATERMARK || event.event_time > max_event_time_) {
            max_event_time_ = event.event_time;
        }
        batch.events.push_back(std::move(event));
    }
    records_read_ += static_cast<int64_t>(batch.events.size());

    if (config_.bounded() && max_event_time_ != NO_WATERMARK) {
        int64_t candidate = saturating_sub(max_event_time_, config_.allowed_lateness_ms);
        if (candidate > watermark_) {
            watermark_ = candidate;
        }
    }

    batch.watermark = watermark_;
    batch.offsets = offsets_;
    return batch;
}

void SourceAdapter::seek(const std::map<int32_t, int64_t>& offsets, int64_t watermark) {
    for (int32_t partition : source_->partitions()) {
        auto it = offsets.find(partition);
        int64_t offset = it != offsets.end() ? it->second
                                             : source_->earliestOffset(partition);
        source_->seek(partition, offset);
        offsets_[partition] = offset;
    }
    watermark_ = config_.bounded() ? watermark : NO_WATERMARK;
    max_event_time_ = watermark_ == NO_WATERMARK
                          ? NO_WATERMARK
                          : saturating_add(watermark_, config_.allowed_lateness_ms);
}

void SourceAdapter::seekToEarliest() {
    seek({}, NO_WATERMARK);
}

std::map<std::string, int64_t> SourceAdapter::getStats() const {
    return {
        {"records_read", records_read_},
        {"malformed_records", malformed_records_},
        {"failed_polls", failed_polls_},
        {"read_retries", read_retries_},
        {"watermark", watermark_}
    };
}

// ========== Private Helper Methods ==========

bool SourceAdapter::decode(const SourceMessage& message, StreamEvent& event) {
    try {
        event.kind = kind_;
        event.record = decode_record(kind_, message.payload);
        event.event_time = record_event_time(event.record);
        event.partition = message.partition;
        event.offset = message.offset;
        return true;
    } catch (const std::invalid_argument& e) {
        malformed_records_++;
        std::cerr << "SourceAdapter[" << stream_kind_to_string(kind_)
                  << "]: skipping partition " << message.partition
                  << " offset " << message.offset << ": " << e.what() << std::endl;
        return false;
    }
}

} // namespace io
} // namespace shopstream
