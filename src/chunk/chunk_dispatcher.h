#pragma once

#include <chrono>
#include <cstdint>
#include <utility>

#include <folly/ScopeGuard.h>
#include <glog/logging.h>

#include "common/configuration.h"
#include "interfaces.h"
#include "progress_state.h"
#include "reply_drain.h"
#include "transactional_item_buffer.h"

namespace RemoteChunk {

/**
 * Turns the items staged in a transaction into one ChunkRequest.
 *
 * Dispatch is not transactional with the caller's write transaction: once a
 * chunk is sent it is not re-sent if that transaction later rolls back.
 */
template<typename T>
class ChunkDispatcher {
public:
    ChunkDispatcher(IChunkTarget<T>& target,
                    TransactionalItemBuffer<T>& buffer,
                    ProgressState& state,
                    ReplyDrain& drain,
                    const CoordinatorOptions& options)
        : target_(target), buffer_(buffer), state_(state), drain_(drain), options_(options) {}

    /**
     * Send whatever txn has staged, waiting first for room under the
     * throttle limit. The staged list is released on every exit path.
     * @return number of items dispatched (0 if nothing was staged)
     */
    size_t Flush(TransactionId txn) {
        // Flush may be called outside the normal write path.
        buffer_.Bind(txn);
        auto release = folly::makeGuard([this, txn]() { buffer_.Release(txn); });

        // Leave room for this chunk: at most throttle_limit in flight afterwards.
        drain_.ThrottleWait(static_cast<uint64_t>(options_.throttle_limit - 1), options_.poll_interval);

        size_t dispatched = 0;
        if (!buffer_.Get(txn).empty()) {
            std::vector<T> items = buffer_.Take(txn);
            dispatched = items.size();
            VLOG(1) << "Dispatching chunk of " << dispatched << " item(s) for job " << state_.job_id()
                    << " from " << txn;
            target_.Send(ChunkRequest<T>(std::move(items), state_.job_id(), state_.skip_count()));
            state_.RecordDispatch();
            ++chunks_sent_;
        }

        // Short little timeout to look for an immediate reply.
        drain_.PollOnce(options_.flush_poll_timeout);
        return dispatched;
    }

    uint64_t chunks_sent() const { return chunks_sent_; }

private:
    IChunkTarget<T>& target_;
    TransactionalItemBuffer<T>& buffer_;
    ProgressState& state_;
    ReplyDrain& drain_;
    const CoordinatorOptions options_;

    uint64_t chunks_sent_ = 0;
};

} // namespace RemoteChunk
