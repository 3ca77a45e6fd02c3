#pragma once

#include <cstdint>

#include "chunk_messages.h"
#include "execution_context.h"

namespace RemoteChunk {

// Checkpoint keys. Always written and read as a pair.
inline constexpr char kExpectedKey[] = "EXPECTED";
inline constexpr char kActualKey[] = "ACTUAL";

/**
 * Counters and job identity describing how much dispatched work is still
 * unanswered. Invariant: expected() >= actual().
 * @threading Single mutator (the step thread); no internal locking.
 */
class ProgressState {
public:
    uint64_t expected() const { return expected_; }
    uint64_t actual() const { return actual_; }
    uint64_t Outstanding() const { return expected_ - actual_; }

    JobId job_id() const { return job_id_; }
    int64_t skip_count() const { return skip_count_; }
    bool has_job() const { return has_job_; }

    void SetJob(JobId job_id, int64_t skip_count);
    void SetSkipCount(int64_t skip_count) { skip_count_ = skip_count; }

    void RecordDispatch() { ++expected_; }

    /**
     * Count one accepted reply.
     * @return false if nothing was outstanding; the reply is then not counted
     *         so the invariant holds under duplicate delivery.
     */
    bool RecordReply();

    /**
     * Replace both counters at once.
     * @throws ValidationError if actual > expected
     */
    void Restore(uint64_t expected, uint64_t actual);

    // Write (EXPECTED, ACTUAL) into the checkpoint store.
    void SaveTo(ExecutionContext& context) const;

    /**
     * Restore (EXPECTED, ACTUAL) from the checkpoint store.
     * @return false if neither key is present (fresh run)
     * @throws ValidationError if only one key is present or the pair is inconsistent
     */
    bool RestoreFrom(const ExecutionContext& context);

    // Zero the counters; job identity is kept.
    void Reset() { expected_ = actual_ = 0; }

    // Zero everything, including job identity.
    void Clear();

private:
    uint64_t expected_ = 0;
    uint64_t actual_ = 0;
    JobId job_id_ = 0;
    int64_t skip_count_ = 0;
    bool has_job_ = false;
};

} // namespace RemoteChunk
