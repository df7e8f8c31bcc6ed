#pragma once

#include <stdexcept>
#include <string>

namespace shopstream {

/**
 * @brief Failure taxonomy of the enrichment pipeline
 *
 * Transient kinds are retried locally; only the conditions documented on
 * each component escalate to the process.
 */
enum class ErrorKind {
    SourceUnavailable,          ///< Partition read failed (transient)
    SinkWriteFailed,            ///< Upsert rejected or sink unreachable (transient)
    CheckpointWriteFailed,      ///< Checkpoint payload or pointer not durable (transient)
    CheckpointCorrupt,          ///< Stored checkpoint fails validation
    StateStoreCapacityExceeded  ///< Pending buffers over their limit
};

inline std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SourceUnavailable: return "SourceUnavailable";
        case ErrorKind::SinkWriteFailed: return "SinkWriteFailed";
        case ErrorKind::CheckpointWriteFailed: return "CheckpointWriteFailed";
        case ErrorKind::CheckpointCorrupt: return "CheckpointCorrupt";
        case ErrorKind::StateStoreCapacityExceeded: return "StateStoreCapacityExceeded";
        default: return "Unknown";
    }
}

/**
 * @brief Base class of all pipeline errors
 */
class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorKind kind, const std::string& message)
        : std::runtime_error(error_kind_to_string(kind) + ": " + message),
          kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class SourceUnavailable : public PipelineError {
public:
    explicit SourceUnavailable(const std::string& message)
        : PipelineError(ErrorKind::SourceUnavailable, message) {}
};

class SinkWriteFailed : public PipelineError {
public:
    explicit SinkWriteFailed(const std::string& message)
        : PipelineError(ErrorKind::SinkWriteFailed, message) {}
};

class CheckpointWriteFailed : public PipelineError {
public:
    explicit CheckpointWriteFailed(const std::string& message)
        : PipelineError(ErrorKind::CheckpointWriteFailed, message) {}
};

class CheckpointCorrupt : public PipelineError {
public:
    explicit CheckpointCorrupt(const std::string& message)
        : PipelineError(ErrorKind::CheckpointCorrupt, message) {}
};

class StateStoreCapacityExceeded : public PipelineError {
public:
    explicit StateStoreCapacityExceeded(const std::string& message)
        : PipelineError(ErrorKind::StateStoreCapacityExceeded, message) {}
};

} // namespace shopstream
