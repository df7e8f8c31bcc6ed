#include "shopstream/utils/config.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace shopstream {

namespace {

std::string trim(const std::string& str) {
    size_t begin = 0;
    while (begin < str.size() && std::isspace(static_cast<unsigned char>(str[begin]))) {
        ++begin;
    }
    size_t end = str.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }
    return str.substr(begin, end - begin);
}

// Helper to get config value with default
template <typename T>
T getConfigValue(const ConfigMap& config, const std::string& key, T default_value) {
    auto it = config.find(key);
    if (it == config.end()) {
        return default_value;
    }

    std::istringstream iss(it->second);
    T value;
    if (iss >> value && iss.eof()) {
        return value;
    }
    throw std::invalid_argument("Invalid value for '" + key + "': " + it->second);
}

template <>
std::string getConfigValue<std::string>(const ConfigMap& config,
                                        const std::string& key,
                                        std::string default_value) {
    auto it = config.find(key);
    return (it != config.end()) ? it->second : default_value;
}

int64_t getDuration(const ConfigMap& config, const std::string& key,
                    int64_t default_value, bool allow_unbounded) {
    auto it = config.find(key);
    if (it == config.end()) {
        return default_value;
    }
    try {
        return parse_duration_ms(it->second, allow_unbounded);
    } catch (const std::invalid_argument& e) {
        throw std::invalid_argument("Invalid value for '" + key + "': " + e.what());
    }
}

} // anonymous namespace

PipelineConfig::PipelineConfig() {
    source(StreamKind::Products).allowed_lateness_ms = UNBOUNDED;
    source(StreamKind::Users).allowed_lateness_ms = UNBOUNDED;
    source(StreamKind::Sales).allowed_lateness_ms = 30000;
    source(StreamKind::Views).allowed_lateness_ms = 30000;
}

int64_t parse_duration_ms(const std::string& value, bool allow_unbounded) {
    std::string lower = trim(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "unbounded" || lower == "none" || lower == "inf") {
        if (!allow_unbounded) {
            throw std::invalid_argument("unbounded is not allowed here");
        }
        return UNBOUNDED;
    }

    size_t pos = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(lower, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("not a duration: " + value);
    }

    // Optional unit suffix
    std::string unit = lower.substr(pos);
    int64_t factor = 1;
    if (unit.empty() || unit == "ms") {
        factor = 1;
    } else if (unit == "s") {
        factor = 1000;
    } else if (unit == "m" || unit == "min") {
        factor = 60 * 1000;
    } else {
        throw std::invalid_argument("unknown duration unit: " + unit);
    }

    if (parsed < 0) {
        throw std::invalid_argument("negative duration: " + value);
    }
    return static_cast<int64_t>(parsed) * factor;
}

PipelineConfig PipelineConfig::from_map(const ConfigMap& config) {
    PipelineConfig result;

    // Per-source settings
    for (StreamKind kind : ALL_STREAM_KINDS) {
        auto& source = result.source(kind);
        std::string name = stream_kind_to_string(kind);
        source.allowed_lateness_ms = getDuration(
            config, "allowed_lateness." + name, source.allowed_lateness_ms, true);
        source.poll_batch_size = getConfigValue<size_t>(
            config, "source_poll_batch_size", source.poll_batch_size);
        source.poll_interval_ms = getDuration(
            config, "source_poll_interval", source.poll_interval_ms, false);
        source.retry_attempts = getConfigValue<int>(
            config, "source_retry_attempts", source.retry_attempts);
        source.retry_backoff_ms = getDuration(
            config, "source_retry_backoff", source.retry_backoff_ms, false);
    }

    if (!result.source(StreamKind::Sales).bounded() ||
        !result.source(StreamKind::Views).bounded()) {
        throw std::invalid_argument(
            "allowed_lateness for sales and views must be bounded");
    }

    // Join
    result.join.match_window_ms = getDuration(
        config, "match_window", result.join.match_window_ms, true);
    result.join.lateness_ms = result.source(StreamKind::Sales).allowed_lateness_ms;
    result.join.max_pending_views = getConfigValue<size_t>(
        config, "max_pending_views", result.join.max_pending_views);
    result.join.finalized_retention_ms = getDuration(
        config, "finalized_view_retention", result.join.finalized_retention_ms, true);

    std::string policy = getConfigValue<std::string>(config, "capacity_policy", "fail");
    if (policy == "fail") {
        result.join.capacity_policy = CapacityPolicy::Fail;
    } else if (policy == "force_finalize_oldest") {
        result.join.capacity_policy = CapacityPolicy::ForceFinalizeOldest;
    } else {
        throw std::invalid_argument("Invalid value for 'capacity_policy': " + policy);
    }

    // Sink
    result.sink.index = getConfigValue<std::string>(config, "sink_index", result.sink.index);
    result.sink.batch_size = getConfigValue<size_t>(
        config, "sink_batch_size", result.sink.batch_size);
    result.sink.batch_interval_ms = getDuration(
        config, "sink_batch_interval", result.sink.batch_interval_ms, false);
    result.sink.max_retry_attempts = getConfigValue<int>(
        config, "max_sink_retry_attempts", result.sink.max_retry_attempts);
    result.sink.retry_backoff_ms = getDuration(
        config, "sink_retry_backoff", result.sink.retry_backoff_ms, false);
    result.sink.output_queue_capacity = getConfigValue<size_t>(
        config, "output_queue_capacity", result.sink.output_queue_capacity);
    result.sink.dead_letter_capacity = getConfigValue<size_t>(
        config, "dead_letter_capacity", result.sink.dead_letter_capacity);

    if (result.sink.batch_size == 0) {
        throw std::invalid_argument("sink_batch_size must be positive");
    }
    if (result.sink.max_retry_attempts < 1) {
        throw std::invalid_argument("max_sink_retry_attempts must be at least 1");
    }

    // Checkpoint
    result.checkpoint.interval_ms = getDuration(
        config, "checkpoint_interval", result.checkpoint.interval_ms, false);
    result.checkpoint.store_location = getConfigValue<std::string>(
        config, "checkpoint_store_location", result.checkpoint.store_location);
    result.checkpoint.retain_count = getConfigValue<size_t>(
        config, "checkpoint_retain_count", result.checkpoint.retain_count);
    result.checkpoint.write_attempts = getConfigValue<int>(
        config, "checkpoint_write_attempts", result.checkpoint.write_attempts);

    if (result.checkpoint.retain_count == 0) {
        throw std::invalid_argument("checkpoint_retain_count must be positive");
    }

    // Pipeline
    result.ingestion_queue_capacity = getConfigValue<size_t>(
        config, "ingestion_queue_capacity", result.ingestion_queue_capacity);
    result.stall_timeout_ms = getDuration(
        config, "stall_timeout", result.stall_timeout_ms, false);
    result.shutdown_grace_ms = getDuration(
        config, "shutdown_grace_period", result.shutdown_grace_ms, false);

    return result;
}

ConfigMap load_config_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    ConfigMap config;
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        auto hash = line.find('#');
        if (hash != std::string::npos) {
            line = line.substr(0, hash);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw std::invalid_argument(
                path + ":" + std::to_string(line_no) + ": expected key = value");
        }
        config[trim(line.substr(0, eq))] = trim(line.substr(eq + 1));
    }

    return config;
}

} // namespace shopstream
