#include "chunk_error.h"

namespace RemoteChunk {

namespace {

std::string DescribeFailure(JobId job_id, ChunkStatus status, const std::string& description) {
    std::string message = "Failure or early completion detected in handler: ";
    message += ChunkStatusName(status);
    message += " (job " + std::to_string(job_id) + ")";
    if (!description.empty()) {
        message += ": " + description;
    }
    return message;
}

} // namespace

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::BUFFER_STATE:
            return "BUFFER_STATE";
        case ErrorKind::VALIDATION:
            return "VALIDATION";
        case ErrorKind::ASYNCHRONOUS_FAILURE:
            return "ASYNCHRONOUS_FAILURE";
        case ErrorKind::TIMEOUT:
            return "TIMEOUT";
        case ErrorKind::SEND_FAILURE:
            return "SEND_FAILURE";
    }
    return "UNKNOWN";
}

ValidationError ValidationError::MissingJobId(JobId expected) {
    return ValidationError(expected, std::nullopt, "Message did not contain job instance id.");
}

ValidationError ValidationError::WrongJobId(JobId expected, JobId received) {
    return ValidationError(expected, received,
            "Message contained wrong job instance id [" + std::to_string(received) +
            "] should have been [" + std::to_string(expected) + "].");
}

AsynchronousFailureError::AsynchronousFailureError(JobId job_id, ChunkStatus status,
                                                   const std::string& description)
    : ChunkError(ErrorKind::ASYNCHRONOUS_FAILURE, DescribeFailure(job_id, status, description)),
      job_id_(job_id),
      status_(status),
      description_(description) {}

TimeoutError::TimeoutError(const std::string& phase, uint64_t outstanding, int attempts)
    : ChunkError(ErrorKind::TIMEOUT,
            "Timed out waiting for back log " + phase + ": " + std::to_string(outstanding) +
            " chunk(s) still outstanding after " + std::to_string(attempts) + " attempts"),
      outstanding_(outstanding),
      attempts_(attempts) {}

SendFailureError::SendFailureError(JobId job_id, size_t item_count, const std::string& cause)
    : ChunkError(ErrorKind::SEND_FAILURE,
            "Failed to send chunk of " + std::to_string(item_count) + " item(s) for job " +
            std::to_string(job_id) + ": " + cause),
      job_id_(job_id),
      item_count_(item_count) {}

} // namespace RemoteChunk
