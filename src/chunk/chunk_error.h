#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include "chunk_messages.h"

namespace RemoteChunk {

enum class ErrorKind {
    BUFFER_STATE,
    VALIDATION,
    ASYNCHRONOUS_FAILURE,
    TIMEOUT,
    SEND_FAILURE
};

const char* ErrorKindName(ErrorKind kind);

/**
 * Base of every fatal condition raised by the coordinator.
 * None of these are retried inside the library; they propagate to the step
 * lifecycle, which decides the step outcome.
 */
class ChunkError : public std::runtime_error {
public:
    ErrorKind kind() const noexcept { return kind_; }

protected:
    ChunkError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

private:
    ErrorKind kind_;
};

// Write/flush without a transaction, or while the coordinator is not ACTIVE.
class BufferStateError : public ChunkError {
public:
    explicit BufferStateError(const std::string& message)
        : ChunkError(ErrorKind::BUFFER_STATE, message) {}
};

// Misrouted reply (job id missing or wrong) or an inconsistent checkpoint.
class ValidationError : public ChunkError {
public:
    ValidationError(std::optional<JobId> expected_job_id,
                    std::optional<JobId> received_job_id,
                    const std::string& message)
        : ChunkError(ErrorKind::VALIDATION, message),
          expected_job_id_(expected_job_id),
          received_job_id_(received_job_id) {}

    static ValidationError MissingJobId(JobId expected);
    static ValidationError WrongJobId(JobId expected, JobId received);

    const std::optional<JobId>& expected_job_id() const { return expected_job_id_; }
    const std::optional<JobId>& received_job_id() const { return received_job_id_; }

private:
    std::optional<JobId> expected_job_id_;
    std::optional<JobId> received_job_id_;
};

// A worker replied with a non-continuable status.
class AsynchronousFailureError : public ChunkError {
public:
    AsynchronousFailureError(JobId job_id, ChunkStatus status, const std::string& description);

    JobId job_id() const { return job_id_; }
    ChunkStatus status() const { return status_; }
    const std::string& description() const { return description_; }

private:
    JobId job_id_;
    ChunkStatus status_;
    std::string description_;
};

// Bounded drain gave up with chunks still outstanding.
class TimeoutError : public ChunkError {
public:
    TimeoutError(const std::string& phase, uint64_t outstanding, int attempts);

    uint64_t outstanding() const { return outstanding_; }
    int attempts() const { return attempts_; }

private:
    uint64_t outstanding_;
    int attempts_;
};

// The outbound channel rejected a request.
class SendFailureError : public ChunkError {
public:
    SendFailureError(JobId job_id, size_t item_count, const std::string& cause);

    JobId job_id() const { return job_id_; }
    size_t item_count() const { return item_count_; }

private:
    JobId job_id_;
    size_t item_count_;
};

} // namespace RemoteChunk
