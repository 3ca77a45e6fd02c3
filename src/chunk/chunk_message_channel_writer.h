#pragma once

#include <memory>
#include <utility>

#include <glog/logging.h>

#include "common/configuration.h"
#include "chunk_dispatcher.h"
#include "chunk_lifecycle.h"
#include "interfaces.h"
#include "transactional_item_buffer.h"

namespace RemoteChunk {

/**
 * Item writer that ships each flushed transaction as one chunk to a remote
 * worker pool and tracks the replies.
 *
 * Usage per step attempt:
 *   Open(ctx) -> OnStepStart(job, skips)
 *   { Write(txn, item)... Flush(txn) | Clear(txn) ; Update(ctx) }*
 *   OnStepEnd(status) -> Close(ctx)
 *
 * @threading All calls from the step thread; only the channels are shared
 *            with worker threads.
 */
template<typename T>
class ChunkMessageChannelWriter : public IStepLifecycle, public IItemStream {
public:
    ChunkMessageChannelWriter(std::shared_ptr<IChunkTarget<T>> target,
                              std::shared_ptr<IReplySource> source,
                              const CoordinatorOptions& options = CoordinatorOptions{})
        : target_(std::move(target)),
          lifecycle_(std::move(source), options),
          dispatcher_(CheckedTarget(target_), buffer_, lifecycle_.progress(), lifecycle_.drain(), options) {}

    /**
     * Stage an item in txn's buffer. Nothing is sent until Flush(txn).
     * @throws BufferStateError if txn is not a transaction or the writer is not ACTIVE
     */
    void Write(TransactionId txn, T item) {
        try {
            lifecycle_.RequireActive("Write");
            buffer_.Append(txn, std::move(item));
        } catch (const ChunkError& e) {
            lifecycle_.RecordFailure(e);
            throw;
        }
        VLOG(2) << "Added item to chunk (" << buffer_.Get(txn).size() << " staged in " << txn << ")";
    }

    /**
     * Dispatch txn's items as one chunk. Blocks while throttle_limit chunks
     * are already in flight.
     * @return number of items dispatched
     * @throws ChunkError of any kind, or whatever the target or reply source
     *         throws; the writer is then FAILED
     */
    size_t Flush(TransactionId txn) {
        try {
            lifecycle_.RequireActive("Flush");
            return dispatcher_.Flush(txn);
        } catch (const ChunkError& e) {
            lifecycle_.RecordFailure(e);
            throw;
        } catch (const std::exception& e) {
            lifecycle_.RecordFailure(e);
            throw;
        }
    }

    // Rollback: drop txn's staged items without sending them.
    void Clear(TransactionId txn) {
        if (buffer_.IsBound(txn)) {
            VLOG(1) << "Discarding " << buffer_.Get(txn).size() << " staged item(s) from " << txn;
        }
        buffer_.Release(txn);
    }

    // IStepLifecycle
    void OnStepStart(JobId job_id, int64_t skip_count) override { lifecycle_.OnStepStart(job_id, skip_count); }
    StepOutcome OnStepEnd(StepStatus status) override { return lifecycle_.OnStepEnd(status); }

    // IItemStream
    void Open(const ExecutionContext& context) override { lifecycle_.Open(context); }
    void Update(ExecutionContext& context) override { lifecycle_.Update(context); }
    void Close(ExecutionContext& context) override {
        if (buffer_.BoundCount() > 0) {
            LOG(WARNING) << "Discarding " << buffer_.BoundCount() << " unflushed transaction buffer(s) on close";
        }
        buffer_.ReleaseAll();
        lifecycle_.Close(context);
    }

    void UpdateSkipCount(int64_t skip_count) { lifecycle_.UpdateSkipCount(skip_count); }

    size_t PendingCount(TransactionId txn) const {
        return buffer_.IsBound(txn) ? buffer_.Get(txn).size() : 0;
    }
    size_t BoundTransactions() const { return buffer_.BoundCount(); }

    LifecycleState state() const { return lifecycle_.state(); }
    const ProgressState& progress() const { return lifecycle_.progress(); }
    uint64_t chunks_sent() const { return dispatcher_.chunks_sent(); }

private:
    static IChunkTarget<T>& CheckedTarget(const std::shared_ptr<IChunkTarget<T>>& target) {
        if (!target) {
            LOG(FATAL) << "ChunkMessageChannelWriter: chunk target must not be null";
        }
        return *target;
    }

    std::shared_ptr<IChunkTarget<T>> target_;
    TransactionalItemBuffer<T> buffer_;
    ChunkLifecycle lifecycle_;
    ChunkDispatcher<T> dispatcher_;
};

} // namespace RemoteChunk
