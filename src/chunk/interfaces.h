#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <utility>

#include "chunk_error.h"
#include "chunk_messages.h"

namespace RemoteChunk {

class ExecutionContext;

/**
 * Outbound channel to the worker pool.
 * Send must not drop silently: a rejected request throws SendFailureError.
 */
template<typename T>
class IChunkTarget {
public:
    virtual ~IChunkTarget() = default;

    virtual void Send(ChunkRequest<T> request) = 0;
};

/**
 * Inbound reply channel. Receive must not block past timeout and returns
 * std::nullopt when nothing arrived in time.
 */
class IReplySource {
public:
    virtual ~IReplySource() = default;

    virtual std::optional<ChunkResponse> Receive(std::chrono::milliseconds timeout) = 0;
};

/**
 * Status of the enclosing step as seen by the step engine when it ends.
 */
enum class StepStatus {
    STARTED,
    COMPLETED,
    STOPPED,
    FAILED
};

enum class StepExitCode {
    CONTINUE,
    FINISHED,
    FAILED
};

/**
 * What OnStepEnd hands back to the step engine.
 */
struct StepOutcome {
    StepExitCode code = StepExitCode::CONTINUE;
    std::string description;
    // Set when code == FAILED because of a coordinator error.
    std::optional<ErrorKind> error;

    static StepOutcome Continue() { return StepOutcome{}; }
    static StepOutcome Finished(std::string description) {
        return StepOutcome{StepExitCode::FINISHED, std::move(description), std::nullopt};
    }
    static StepOutcome Failed(std::string description, ErrorKind error) {
        return StepOutcome{StepExitCode::FAILED, std::move(description), error};
    }
    // Failure that did not originate in the coordinator (e.g. a throwing reply source).
    static StepOutcome Failed(std::string description) {
        return StepOutcome{StepExitCode::FAILED, std::move(description), std::nullopt};
    }
};

/**
 * Hooks invoked by the step engine around a step attempt.
 */
class IStepLifecycle {
public:
    virtual ~IStepLifecycle() = default;

    virtual void OnStepStart(JobId job_id, int64_t skip_count) = 0;
    virtual StepOutcome OnStepEnd(StepStatus status) = 0;
};

/**
 * Checkpoint hooks invoked by the step engine.
 */
class IItemStream {
public:
    virtual ~IItemStream() = default;

    virtual void Open(const ExecutionContext& context) = 0;
    virtual void Update(ExecutionContext& context) = 0;
    virtual void Close(ExecutionContext& context) = 0;
};

const char* StepStatusName(StepStatus status);
const char* StepExitCodeName(StepExitCode code);

} // namespace RemoteChunk
