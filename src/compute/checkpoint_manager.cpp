#include "shopstream/compute/checkpoint_manager.h"
#include "shopstream/core/errors.h"
#include <algorithm>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace shopstream {
namespace compute {

namespace {

const uint64_t FNV_OFFSET_BASIS = 14695981039346656037ULL;
const uint64_t FNV_PRIME = 1099511628211ULL;

// Size of magic + format version + trailer
const size_t ENVELOPE_SIZE = 4 + 4 + 8;

} // anonymous namespace

CheckpointManager::CheckpointManager(io::CheckpointStore* store,
                                     const CheckpointConfig& config,
                                     ShutdownSignal* abort_signal)
    : store_(store), config_(config), abort_signal_(abort_signal) {
    if (!store_) {
        throw std::invalid_argument("CheckpointManager: store is required");
    }
    if (config_.write_attempts < 1) {
        throw std::invalid_argument("CheckpointManager: write_attempts must be >= 1");
    }
    if (config_.retain_count == 0) {
        throw std::invalid_argument("CheckpointManager: retain_count must be >= 1");
    }
}

// ========== Persistence ==========

uint64_t CheckpointManager::persist(Checkpoint checkpoint) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto versions = store_->listVersions();
    uint64_t version = versions.empty() ? 1 : versions.back() + 1;
    auto latest = store_->latestVersion();
    if (latest && *latest >= version) {
        version = *latest + 1;
    }

    std::string last_error;
    for (int attempt = 0; attempt < config_.write_attempts; ++attempt) {
        if (attempt > 0) {
            auto delay = backoff_delay(config_.write_backoff_ms, attempt - 1);
            if (abort_signal_) {
                if (abort_signal_->wait_for(delay)) {
                    break;
                }
            } else {
                std::this_thread::sleep_for(delay);
            }
        }

        if (checkpoint.created_at_ms == 0) {
            checkpoint.created_at_ms = current_time_ms();
        }
        checkpoint.version = version;
        auto payload = serialize(checkpoint);

        try {
            // Payloads are immutable: a version left behind by an earlier
            // failed publish is skipped, never overwritten
            while (!store_->writePayload(version, payload)) {
                checkpoint.version = ++version;
                payload = serialize(checkpoint);
            }
            store_->publishLatest(version);
        } catch (const CheckpointWriteFailed& e) {
            last_error = e.what();
            std::cerr << "CheckpointManager: attempt " << (attempt + 1) << "/"
                      << config_.write_attempts << " for version " << version
                      << " failed: " << e.what() << std::endl;
            continue;
        }

        checkpoints_written_++;
        last_version_.store(static_cast<int64_t>(version));
        last_size_bytes_.store(static_cast<int64_t>(payload.size()));
        std::cout << "CheckpointManager: wrote checkpoint " << version << " ("
                  << payload.size() << " bytes, emitted seq " << checkpoint.emitted_seq
                  << ", " << checkpoint.state.pending_views.size() << " pending views)"
                  << std::endl;
        applyRetention(version);
        return version;
    }

    write_failures_++;
    throw CheckpointWriteFailed("checkpoint not persisted after " +
                                std::to_string(config_.write_attempts) +
                                " attempts: " + last_error);
}

RestoreResult CheckpointManager::restoreLatest() {
    std::lock_guard<std::mutex> lock(mutex_);
    RestoreResult result;

    auto versions = store_->listVersions();
    auto latest = store_->latestVersion();

    // Candidates: LATEST first, then older versions newest first. Versions
    // newer than LATEST were never published and are ignored. Without a
    // pointer every stored version is a candidate.
    std::vector<uint64_t> candidates;
    if (latest) {
        candidates.push_back(*latest);
    }
    for (auto it = versions.rbegin(); it != versions.rend(); ++it) {
        if (latest && *it >= *latest) {
            continue;
        }
        candidates.push_back(*it);
    }

    for (uint64_t version : candidates) {
        try {
            result.checkpoint = load(version);
            std::cout << "CheckpointManager: restored checkpoint " << version
                      << " (global watermark " << result.checkpoint->global_watermark
                      << ", emitted seq " << result.checkpoint->emitted_seq << ")"
                      << std::endl;
            return result;
        } catch (const CheckpointCorrupt& e) {
            result.corrupt_versions++;
            corrupt_skipped_++;
            std::cerr << "CheckpointManager: skipping checkpoint " << version << ": "
                      << e.what() << std::endl;
        }
    }

    if (!candidates.empty()) {
        result.data_loss = true;
        std::cerr << "CheckpointManager: WARNING no valid checkpoint among "
                  << candidates.size()
                  << " candidates; cold start from earliest offsets, state is rebuilt"
                  << " from retained input only" << std::endl;
    } else {
        std::cout << "CheckpointManager: no checkpoint found, cold start" << std::endl;
    }
    return result;
}

Checkpoint CheckpointManager::load(uint64_t version) const {
    auto payload = store_->readPayload(version);
    if (!payload) {
        throw CheckpointCorrupt("checkpoint " + std::to_string(version) + " is missing");
    }
    Checkpoint checkpoint = deserialize(*payload);
    if (checkpoint.version != version) {
        throw CheckpointCorrupt("checkpoint " + std::to_string(version) +
                                " carries version " + std::to_string(checkpoint.version));
    }
    return checkpoint;
}

// ========== Serialization ==========

std::vector<uint8_t> CheckpointManager::serialize(const Checkpoint& checkpoint) {
    std::vector<uint8_t> buffer;
    buffer.reserve(4096);

    auto append = [&buffer](const void* data, size_t size) {
        const uint8_t* bytes = static_cast<const uint8_t*>(data);
        buffer.insert(buffer.end(), bytes, bytes + size);
    };
    auto append_string = [&append](const std::string& str) {
        uint32_t len = static_cast<uint32_t>(str.size());
        append(&len, sizeof(len));
        append(str.data(), str.size());
    };
    auto append_count = [&append](size_t count) {
        uint32_t value = static_cast<uint32_t>(count);
        append(&value, sizeof(value));
    };

    append(&MAGIC, sizeof(MAGIC));
    append(&FORMAT_VERSION, sizeof(FORMAT_VERSION));

    append(&checkpoint.version, sizeof(checkpoint.version));
    append(&checkpoint.created_at_ms, sizeof(checkpoint.created_at_ms));
    append(&checkpoint.global_watermark, sizeof(checkpoint.global_watermark));
    append(&checkpoint.emitted_seq, sizeof(checkpoint.emitted_seq));

    // Source progress
    append_count(checkpoint.offsets.size());
    for (const auto& [kind, partitions] : checkpoint.offsets) {
        uint8_t kind_id = static_cast<uint8_t>(kind);
        append(&kind_id, sizeof(kind_id));
        append_count(partitions.size());
        for (const auto& [partition, offset] : partitions) {
            append(&partition, sizeof(partition));
            append(&offset, sizeof(offset));
        }
    }
    append_count(checkpoint.source_watermarks.size());
    for (const auto& [kind, watermark] : checkpoint.source_watermarks) {
        uint8_t kind_id = static_cast<uint8_t>(kind);
        append(&kind_id, sizeof(kind_id));
        append(&watermark, sizeof(watermark));
    }

    // State snapshot
    const auto& state = checkpoint.state;
    append_count(state.products.size());
    for (const auto& product : state.products) {
        append_string(product.id);
        append_string(product.brand);
        append_string(product.name);
        append(&product.sale_price, sizeof(product.sale_price));
        append(&product.rating, sizeof(product.rating));
        append(&product.event_time, sizeof(product.event_time));
    }
    append_count(state.users.size());
    for (const auto& user : state.users) {
        append_string(user.id);
        append_string(user.first_name);
        append_string(user.last_name);
        append_string(user.email);
        append_string(user.phone);
        append_string(user.address);
        append_string(user.city);
        append_string(user.state);
        append_string(user.zip_code);
        append(&user.event_time, sizeof(user.event_time));
    }
    append_count(state.sales.size());
    for (const auto& sale : state.sales) {
        append(&sale.order_id, sizeof(sale.order_id));
        append_string(sale.product_id);
        append_string(sale.customer_id);
        append(&sale.event_time, sizeof(sale.event_time));
    }
    append_count(state.pending_views.size());
    for (const auto& pending : state.pending_views) {
        append_string(pending.view.product_id);
        append_string(pending.view.user_id);
        append(&pending.view.view_time, sizeof(pending.view.view_time));
        append_string(pending.view.page_url);
        append_string(pending.view.ip);
        append(&pending.view.event_time, sizeof(pending.view.event_time));
        append(&pending.deadline, sizeof(pending.deadline));
        append(&pending.arrival_seq, sizeof(pending.arrival_seq));
    }
    append(&state.next_arrival_seq, sizeof(state.next_arrival_seq));
    append_count(state.finalized_views.size());
    for (const auto& [id, deadline] : state.finalized_views) {
        append_string(id);
        append(&deadline, sizeof(deadline));
    }

    uint64_t checksum = fnv1a(buffer.data(), buffer.size());
    append(&checksum, sizeof(checksum));
    return buffer;
}

Checkpoint CheckpointManager::deserialize(const std::vector<uint8_t>& data) {
    if (data.size() < ENVELOPE_SIZE) {
        throw CheckpointCorrupt("payload too short (" + std::to_string(data.size()) +
                                " bytes)");
    }

    uint64_t stored_checksum;
    std::memcpy(&stored_checksum, data.data() + data.size() - sizeof(stored_checksum),
                sizeof(stored_checksum));
    const size_t body_end = data.size() - sizeof(stored_checksum);
    if (fnv1a(data.data(), body_end) != stored_checksum) {
        throw CheckpointCorrupt("checksum mismatch");
    }

    size_t offset = 0;

    auto read = [&data, &offset, body_end](void* dest, size_t size) {
        if (offset + size > body_end) {
            throw CheckpointCorrupt("truncated payload at byte " + std::to_string(offset));
        }
        std::memcpy(dest, data.data() + offset, size);
        offset += size;
    };
    auto read_string = [&read, &offset, body_end]() -> std::string {
        uint32_t len;
        read(&len, sizeof(len));
        if (len > body_end - offset) {
            throw CheckpointCorrupt("string length " + std::to_string(len) +
                                    " exceeds payload");
        }
        std::string str(len, '\0');
        if (len > 0) {
            read(&str[0], len);
        }
        return str;
    };
    auto read_count = [&read]() -> uint32_t {
        uint32_t count;
        read(&count, sizeof(count));
        return count;
    };
    auto read_kind = [&read]() -> StreamKind {
        uint8_t kind_id;
        read(&kind_id, sizeof(kind_id));
        if (kind_id >= STREAM_KIND_COUNT) {
            throw CheckpointCorrupt("unknown stream kind " + std::to_string(kind_id));
        }
        return static_cast<StreamKind>(kind_id);
    };

    uint32_t magic;
    uint32_t format_version;
    read(&magic, sizeof(magic));
    read(&format_version, sizeof(format_version));
    if (magic != MAGIC) {
        throw CheckpointCorrupt("bad magic number");
    }
    if (format_version != FORMAT_VERSION) {
        throw CheckpointCorrupt("unsupported format version " +
                                std::to_string(format_version));
    }

    Checkpoint checkpoint;
    read(&checkpoint.version, sizeof(checkpoint.version));
    read(&checkpoint.created_at_ms, sizeof(checkpoint.created_at_ms));
    read(&checkpoint.global_watermark, sizeof(checkpoint.global_watermark));
    read(&checkpoint.emitted_seq, sizeof(checkpoint.emitted_seq));

    uint32_t source_count = read_count();
    for (uint32_t i = 0; i < source_count; ++i) {
        StreamKind kind = read_kind();
        auto& partitions = checkpoint.offsets[kind];
        uint32_t partition_count = read_count();
        for (uint32_t p = 0; p < partition_count; ++p) {
            int32_t partition;
            int64_t next_offset;
            read(&partition, sizeof(partition));
            read(&next_offset, sizeof(next_offset));
            partitions[partition] = next_offset;
        }
    }
    uint32_t watermark_count = read_count();
    for (uint32_t i = 0; i < watermark_count; ++i) {
        StreamKind kind = read_kind();
        int64_t watermark;
        read(&watermark, sizeof(watermark));
        checkpoint.source_watermarks[kind] = watermark;
    }

    auto& state = checkpoint.state;
    uint32_t product_count = read_count();
    for (uint32_t i = 0; i < product_count; ++i) {
        ProductRecord product;
        product.id = read_string();
        product.brand = read_string();
        product.name = read_string();
        read(&product.sale_price, sizeof(product.sale_price));
        read(&product.rating, sizeof(product.rating));
        read(&product.event_time, sizeof(product.event_time));
        state.products.push_back(std::move(product));
    }
    uint32_t user_count = read_count();
    for (uint32_t i = 0; i < user_count; ++i) {
        UserRecord user;
        user.id = read_string();
        user.first_name = read_string();
        user.last_name = read_string();
        user.email = read_string();
        user.phone = read_string();
        user.address = read_string();
        user.city = read_string();
        user.state = read_string();
        user.zip_code = read_string();
        read(&user.event_time, sizeof(user.event_time));
        state.users.push_back(std::move(user));
    }
    uint32_t sale_count = read_count();
    for (uint32_t i = 0; i < sale_count; ++i) {
        SaleEvent sale;
        read(&sale.order_id, sizeof(sale.order_id));
        sale.product_id = read_string();
        sale.customer_id = read_string();
        read(&sale.event_time, sizeof(sale.event_time));
        state.sales.push_back(std::move(sale));
    }
    uint32_t pending_count = read_count();
    for (uint32_t i = 0; i < pending_count; ++i) {
        PendingView pending;
        pending.view.product_id = read_string();
        pending.view.user_id = read_string();
        read(&pending.view.view_time, sizeof(pending.view.view_time));
        pending.view.page_url = read_string();
        pending.view.ip = read_string();
        read(&pending.view.event_time, sizeof(pending.view.event_time));
        read(&pending.deadline, sizeof(pending.deadline));
        read(&pending.arrival_seq, sizeof(pending.arrival_seq));
        state.pending_views.push_back(std::move(pending));
    }
    read(&state.next_arrival_seq, sizeof(state.next_arrival_seq));
    uint32_t finalized_count = read_count();
    for (uint32_t i = 0; i < finalized_count; ++i) {
        std::string id = read_string();
        int64_t deadline;
        read(&deadline, sizeof(deadline));
        state.finalized_views.emplace_back(std::move(id), deadline);
    }

    if (offset != body_end) {
        throw CheckpointCorrupt(std::to_string(body_end - offset) + " trailing bytes");
    }
    return checkpoint;
}

uint64_t CheckpointManager::fnv1a(const uint8_t* data, size_t size) {
    uint64_t hash = FNV_OFFSET_BASIS;
    for (size_t i = 0; i < size; ++i) {
        hash ^= data[i];
        hash *= FNV_PRIME;
    }
    return hash;
}

std::map<std::string, int64_t> CheckpointManager::getStats() const {
    return {
        {"checkpoints_written", checkpoints_written_.load()},
        {"checkpoint_write_failures", write_failures_.load()},
        {"last_checkpoint_version", last_version_.load()},
        {"last_checkpoint_bytes", last_size_bytes_.load()},
        {"corrupt_checkpoints_skipped", corrupt_skipped_.load()}
    };
}

// ========== Private Helper Methods ==========

void CheckpointManager::applyRetention(uint64_t latest) {
    auto versions = store_->listVersions();
    if (versions.size() <= config_.retain_count) {
        return;
    }
    size_t excess = versions.size() - config_.retain_count;
    for (size_t i = 0; i < excess; ++i) {
        if (versions[i] == latest) {
            continue;
        }
        if (!store_->deleteVersion(versions[i])) {
            std::cerr << "CheckpointManager: could not delete checkpoint " << versions[i]
                      << std::endl;
        }
    }
}

} // namespace compute
} // namespace shopstream
