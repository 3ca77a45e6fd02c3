#include "progress_state.h"

#include <glog/logging.h>

#include "chunk_error.h"

namespace RemoteChunk {

void ProgressState::SetJob(JobId job_id, int64_t skip_count) {
    job_id_ = job_id;
    skip_count_ = skip_count;
    has_job_ = true;
}

bool ProgressState::RecordReply() {
    if (actual_ >= expected_) {
        LOG(WARNING) << "Reply for job " << job_id_ << " arrived with nothing outstanding (expected="
                     << expected_ << ", actual=" << actual_ << "); not counted";
        return false;
    }
    ++actual_;
    return true;
}

void ProgressState::Restore(uint64_t expected, uint64_t actual) {
    if (actual > expected) {
        throw ValidationError(std::nullopt, std::nullopt,
                "Inconsistent checkpoint: " + std::string(kActualKey) + "=" + std::to_string(actual) +
                " exceeds " + std::string(kExpectedKey) + "=" + std::to_string(expected));
    }
    expected_ = expected;
    actual_ = actual;
}

void ProgressState::SaveTo(ExecutionContext& context) const {
    context.PutLong(kExpectedKey, expected_);
    context.PutLong(kActualKey, actual_);
}

bool ProgressState::RestoreFrom(const ExecutionContext& context) {
    auto expected = context.GetLong(kExpectedKey);
    auto actual = context.GetLong(kActualKey);
    if (!expected && !actual) {
        return false;
    }
    if (!expected || !actual) {
        throw ValidationError(std::nullopt, std::nullopt,
                std::string("Incomplete checkpoint: ") + (expected ? kActualKey : kExpectedKey) +
                " is missing");
    }
    Restore(*expected, *actual);
    return true;
}

void ProgressState::Clear() {
    Reset();
    job_id_ = 0;
    skip_count_ = 0;
    has_job_ = false;
}

} // namespace RemoteChunk
