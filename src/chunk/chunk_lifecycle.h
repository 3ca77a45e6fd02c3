#pragma once

#include <exception>
#include <memory>

#include "common/configuration.h"
#include "chunk_error.h"
#include "interfaces.h"
#include "progress_state.h"
#include "reply_drain.h"

namespace RemoteChunk {

/**
 * INIT -> ACTIVE -> DRAINING -> {COMPLETE | FAILED | TIMED_OUT}
 * A resumed attempt passes through DRAINING on its way to ACTIVE.
 */
enum class LifecycleState {
    INIT,
    ACTIVE,
    DRAINING,
    COMPLETE,
    FAILED,
    TIMED_OUT
};

const char* LifecycleStateName(LifecycleState state);

/**
 * Step-level integration of the coordinator: captures the job identity,
 * drains a restored backlog before new work is accepted, drains again when
 * the step's own processing is done, and checkpoints (EXPECTED, ACTUAL).
 */
class ChunkLifecycle : public IStepLifecycle, public IItemStream {
public:
    ChunkLifecycle(std::shared_ptr<IReplySource> source, const CoordinatorOptions& options);

    // IStepLifecycle
    /**
     * Capture job identity and drain anything restored from a checkpoint.
     * @throws TimeoutError if the restored backlog does not drain in time
     * @throws ValidationError, AsynchronousFailureError from the drain
     */
    void OnStepStart(JobId job_id, int64_t skip_count) override;

    /**
     * Drain outstanding chunks if the step completed. Never throws: any
     * exception from the drain becomes a FAILED outcome.
     * @return CONTINUE if the step did not complete, FINISHED or FAILED otherwise
     */
    StepOutcome OnStepEnd(StepStatus status) override;

    // IItemStream
    void Open(const ExecutionContext& context) override;
    void Update(ExecutionContext& context) override;
    void Close(ExecutionContext& context) override;

    void UpdateSkipCount(int64_t skip_count) { progress_.SetSkipCount(skip_count); }

    // Writes and flushes are only legal while ACTIVE.
    void RequireActive(const char* operation) const;

    // Record a fatal error raised on the write/flush path.
    void RecordFailure(const ChunkError& error);
    // Same, for errors thrown by a collaborator (target or reply source).
    void RecordFailure(const std::exception& error);

    LifecycleState state() const { return state_; }
    const ProgressState& progress() const { return progress_; }
    ProgressState& progress() { return progress_; }
    ReplyDrain& drain() { return drain_; }
    const CoordinatorOptions& options() const { return options_; }

private:
    void ResumeBacklog();

    std::shared_ptr<IReplySource> source_;
    const CoordinatorOptions options_;
    ProgressState progress_;
    ReplyDrain drain_;
    LifecycleState state_ = LifecycleState::INIT;
};

} // namespace RemoteChunk
