#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace RemoteChunk {

using JobId = int64_t;

/**
 * Outcome reported by a remote worker for one chunk.
 * Only CONTINUABLE is normal progress; FINISHED means the worker ended
 * early and FAILED means the chunk was not processed.
 */
enum class ChunkStatus {
    CONTINUABLE,
    FINISHED,
    FAILED
};

const char* ChunkStatusName(ChunkStatus status);
std::ostream& operator<<(std::ostream& os, ChunkStatus status);

/**
 * One batch of items shipped to a worker. Immutable once constructed.
 * Default-constructible only so it can travel through bounded queues.
 */
template<typename T>
class ChunkRequest {
public:
    ChunkRequest() = default;
    ChunkRequest(std::vector<T> items, JobId job_id, int64_t skip_count)
        : items_(std::move(items)), job_id_(job_id), skip_count_(skip_count) {}

    const std::vector<T>& items() const { return items_; }
    JobId job_id() const { return job_id_; }
    int64_t skip_count() const { return skip_count_; }
    size_t size() const { return items_.size(); }

private:
    std::vector<T> items_;
    JobId job_id_ = 0;
    int64_t skip_count_ = 0;
};

/**
 * Reply to a ChunkRequest, matched by job id only.
 */
class ChunkResponse {
public:
    ChunkResponse() = default;
    ChunkResponse(std::optional<JobId> job_id, ChunkStatus status, std::string description = "")
        : job_id_(job_id), status_(status), description_(std::move(description)) {}

    static ChunkResponse Continuable(JobId job_id) {
        return ChunkResponse(job_id, ChunkStatus::CONTINUABLE);
    }

    static ChunkResponse Failed(JobId job_id, std::string description) {
        return ChunkResponse(job_id, ChunkStatus::FAILED, std::move(description));
    }

    const std::optional<JobId>& job_id() const { return job_id_; }
    ChunkStatus status() const { return status_; }
    const std::string& description() const { return description_; }
    bool IsContinuable() const { return status_ == ChunkStatus::CONTINUABLE; }

private:
    std::optional<JobId> job_id_;
    ChunkStatus status_ = ChunkStatus::CONTINUABLE;
    std::string description_;
};

} // namespace RemoteChunk
