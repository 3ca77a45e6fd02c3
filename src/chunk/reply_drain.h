#pragma once

#include <chrono>
#include <cstdint>

#include "interfaces.h"
#include "progress_state.h"

namespace RemoteChunk {

/**
 * Applies worker replies to a ProgressState.
 *
 * All waiting is done by polling the reply source with a bounded timeout on
 * the caller's thread; there is no listener thread.
 * - PollOnce: one receive, validate, count, fail on non-continuable status
 * - ThrottleWait: unbounded loop until outstanding <= limit
 * - Drain: bounded loop until outstanding == 0
 */
class ReplyDrain {
public:
    ReplyDrain(IReplySource& source, ProgressState& state);

    /**
     * Receive at most one reply.
     * @param timeout Upper bound on the wait
     * @return true if a reply arrived
     * @throws ValidationError if the reply's job id is missing or wrong
     * @throws AsynchronousFailureError if the reply is not CONTINUABLE
     */
    bool PollOnce(std::chrono::milliseconds timeout);

    /**
     * Block until outstanding <= limit. No overall deadline: a stuck worker
     * stalls the caller here.
     */
    void ThrottleWait(uint64_t limit, std::chrono::milliseconds poll_interval);

    /**
     * Wait for every outstanding reply, polling at most max_attempts times.
     * @return true if outstanding reached zero
     */
    bool Drain(int max_attempts, std::chrono::milliseconds poll_timeout);

    uint64_t polls() const { return polls_; }
    uint64_t replies() const { return replies_; }

private:
    IReplySource& source_;
    ProgressState& state_;

    // Diagnostics
    uint64_t polls_ = 0;
    uint64_t replies_ = 0;
};

} // namespace RemoteChunk
