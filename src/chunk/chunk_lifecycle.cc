#include "chunk_lifecycle.h"

#include <string>
#include <utility>

#include <glog/logging.h>

namespace RemoteChunk {

namespace {

IReplySource& CheckedSource(const std::shared_ptr<IReplySource>& source) {
    if (!source) {
        LOG(FATAL) << "ChunkLifecycle: reply source must not be null";
    }
    return *source;
}

} // namespace

const char* LifecycleStateName(LifecycleState state) {
    switch (state) {
        case LifecycleState::INIT:
            return "INIT";
        case LifecycleState::ACTIVE:
            return "ACTIVE";
        case LifecycleState::DRAINING:
            return "DRAINING";
        case LifecycleState::COMPLETE:
            return "COMPLETE";
        case LifecycleState::FAILED:
            return "FAILED";
        case LifecycleState::TIMED_OUT:
            return "TIMED_OUT";
    }
    return "UNKNOWN";
}

const char* StepStatusName(StepStatus status) {
    switch (status) {
        case StepStatus::STARTED:
            return "STARTED";
        case StepStatus::COMPLETED:
            return "COMPLETED";
        case StepStatus::STOPPED:
            return "STOPPED";
        case StepStatus::FAILED:
            return "FAILED";
    }
    return "UNKNOWN";
}

const char* StepExitCodeName(StepExitCode code) {
    switch (code) {
        case StepExitCode::CONTINUE:
            return "CONTINUE";
        case StepExitCode::FINISHED:
            return "FINISHED";
        case StepExitCode::FAILED:
            return "FAILED";
    }
    return "UNKNOWN";
}

ChunkLifecycle::ChunkLifecycle(std::shared_ptr<IReplySource> source, const CoordinatorOptions& options)
    : source_(std::move(source)),
      options_(options),
      drain_(CheckedSource(source_), progress_) {

    // Validate parameters
    if (options_.throttle_limit < 1 || options_.drain_max_attempts < 1) {
        LOG(FATAL) << "ChunkLifecycle: Invalid options (throttle_limit=" << options_.throttle_limit
                   << ", drain_max_attempts=" << options_.drain_max_attempts << ")";
    }
}

void ChunkLifecycle::OnStepStart(JobId job_id, int64_t skip_count) {
    if (state_ != LifecycleState::INIT) {
        throw BufferStateError(std::string("Step start in state ") + LifecycleStateName(state_) +
                "; Close() the previous attempt first");
    }
    progress_.SetJob(job_id, skip_count);
    LOG(INFO) << "Step started for job " << job_id << " (skip_count=" << skip_count << ")";
    ResumeBacklog();
}

StepOutcome ChunkLifecycle::OnStepEnd(StepStatus status) {
    if (status != StepStatus::COMPLETED) {
        VLOG(1) << "Step ended with status " << StepStatusName(status) << "; not waiting for results";
        return StepOutcome::Continue();
    }
    if (state_ != LifecycleState::ACTIVE) {
        std::string message = std::string("Cannot wait for results in state ") + LifecycleStateName(state_);
        LOG(ERROR) << message;
        return StepOutcome::Failed(message, ErrorKind::BUFFER_STATE);
    }

    uint64_t expecting = progress_.Outstanding();
    state_ = LifecycleState::DRAINING;
    LOG(INFO) << "Waiting for " << expecting << " result(s) at end of step...";

    bool drained = false;
    try {
        drained = drain_.Drain(options_.drain_max_attempts, options_.poll_interval);
    } catch (const ChunkError& e) {
        LOG(ERROR) << "Detected failure waiting for results at end of step: " << e.what();
        state_ = LifecycleState::FAILED;
        return StepOutcome::Failed(std::string(ErrorKindName(e.kind())) + ": " + e.what(), e.kind());
    } catch (const std::exception& e) {
        LOG(ERROR) << "Reply source failed at end of step: " << e.what();
        state_ = LifecycleState::FAILED;
        return StepOutcome::Failed(std::string("Reply source failed: ") + e.what());
    }

    if (!drained) {
        TimeoutError timeout("at end of step", progress_.Outstanding(), options_.drain_max_attempts);
        LOG(ERROR) << timeout.what();
        state_ = LifecycleState::TIMED_OUT;
        return StepOutcome::Failed(timeout.what(), timeout.kind());
    }

    state_ = LifecycleState::COMPLETE;
    LOG(INFO) << "All results received for job " << progress_.job_id();
    return StepOutcome::Finished("Waited for " + std::to_string(expecting) + " results.");
}

void ChunkLifecycle::Open(const ExecutionContext& context) {
    if (state_ != LifecycleState::INIT && state_ != LifecycleState::ACTIVE) {
        throw BufferStateError(std::string("Open in state ") + LifecycleStateName(state_));
    }
    if (state_ == LifecycleState::ACTIVE && progress_.expected() > 0) {
        throw BufferStateError("Open after chunks were dispatched would overwrite live counters");
    }
    if (!progress_.RestoreFrom(context)) {
        VLOG(1) << "No checkpoint found; starting fresh";
        return;
    }
    LOG(INFO) << "Restored checkpoint: expected=" << progress_.expected()
              << ", actual=" << progress_.actual();

    // Step already started: the job id is known, resume right away.
    if (state_ == LifecycleState::ACTIVE) {
        ResumeBacklog();
    }
}

void ChunkLifecycle::Update(ExecutionContext& context) {
    progress_.SaveTo(context);
}

void ChunkLifecycle::Close(ExecutionContext& /*context*/) {
    progress_.Clear();
    state_ = LifecycleState::INIT;
}

void ChunkLifecycle::RequireActive(const char* operation) const {
    if (state_ != LifecycleState::ACTIVE) {
        throw BufferStateError(std::string(operation) + " rejected: coordinator is " +
                LifecycleStateName(state_) + ", not ACTIVE");
    }
}

void ChunkLifecycle::RecordFailure(const ChunkError& error) {
    LOG(ERROR) << "Chunk coordination failed (" << ErrorKindName(error.kind()) << "): " << error.what();
    state_ = error.kind() == ErrorKind::TIMEOUT ? LifecycleState::TIMED_OUT : LifecycleState::FAILED;
}

void ChunkLifecycle::RecordFailure(const std::exception& error) {
    LOG(ERROR) << "Chunk coordination failed: " << error.what();
    state_ = LifecycleState::FAILED;
}

void ChunkLifecycle::ResumeBacklog() {
    uint64_t backlog = progress_.Outstanding();
    if (backlog == 0) {
        state_ = LifecycleState::ACTIVE;
        return;
    }

    LOG(INFO) << "Resuming job " << progress_.job_id() << " with " << backlog
              << " chunk(s) outstanding from a previous attempt";
    state_ = LifecycleState::DRAINING;
    bool drained = false;
    try {
        drained = drain_.Drain(options_.drain_max_attempts, options_.poll_interval);
    } catch (const ChunkError& e) {
        RecordFailure(e);
        throw;
    } catch (const std::exception& e) {
        RecordFailure(e);
        throw;
    }
    if (!drained) {
        TimeoutError timeout("on open", progress_.Outstanding(), options_.drain_max_attempts);
        RecordFailure(timeout);
        throw timeout;
    }
    state_ = LifecycleState::ACTIVE;
    LOG(INFO) << "Backlog of " << backlog << " chunk(s) drained; accepting new work";
}

} // namespace RemoteChunk
