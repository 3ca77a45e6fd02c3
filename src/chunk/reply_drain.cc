#include "reply_drain.h"

#include <glog/logging.h>

#include "chunk_error.h"

namespace RemoteChunk {

ReplyDrain::ReplyDrain(IReplySource& source, ProgressState& state)
    : source_(source), state_(state) {}

bool ReplyDrain::PollOnce(std::chrono::milliseconds timeout) {
    ++polls_;
    auto reply = source_.Receive(timeout);
    if (!reply.has_value()) {
        return false;
    }
    ++replies_;

    const auto& job_id = reply->job_id();
    if (!job_id.has_value()) {
        throw ValidationError::MissingJobId(state_.job_id());
    }
    if (*job_id != state_.job_id()) {
        throw ValidationError::WrongJobId(state_.job_id(), *job_id);
    }

    if (state_.RecordReply()) {
        VLOG(2) << "Reply " << reply->status() << " for job " << *job_id
                << " (expected=" << state_.expected() << ", actual=" << state_.actual() << ")";
    }

    // FINISHED is as fatal as FAILED: a worker must never end the job on its own.
    if (!reply->IsContinuable()) {
        throw AsynchronousFailureError(*job_id, reply->status(), reply->description());
    }
    return true;
}

void ReplyDrain::ThrottleWait(uint64_t limit, std::chrono::milliseconds poll_interval) {
    if (state_.Outstanding() > limit) {
        VLOG(1) << "Throttling: " << state_.Outstanding() << " chunk(s) outstanding, limit " << limit;
    }
    while (state_.Outstanding() > limit) {
        PollOnce(poll_interval);
    }
}

bool ReplyDrain::Drain(int max_attempts, std::chrono::milliseconds poll_timeout) {
    int attempts = 0;
    while (state_.Outstanding() > 0 && attempts < max_attempts) {
        ++attempts;
        PollOnce(poll_timeout);
    }
    VLOG(1) << "Drain finished after " << attempts << " attempt(s), "
            << state_.Outstanding() << " outstanding";
    return state_.Outstanding() == 0;
}

} // namespace RemoteChunk
