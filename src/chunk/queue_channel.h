#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <utility>

#include "folly/MPMCQueue.h"
#include "chunk_error.h"
#include "interfaces.h"

namespace RemoteChunk {

/**
 * Bounded in-process channel between the coordinator and worker threads.
 *
 * Design:
 * - Lock-free MPMC queue (folly::MPMCQueue), fixed capacity
 * - Send waits up to send_timeout for a free slot, then reports failure
 * - Receive waits up to the caller's timeout, then returns std::nullopt
 */
template<typename M>
class QueueChannel {
public:
    QueueChannel(size_t capacity, std::chrono::milliseconds send_timeout)
        : queue_(capacity), capacity_(capacity), send_timeout_(send_timeout) {}

    // @return false if no slot freed up within send_timeout
    bool TrySend(M message) {
        auto deadline = std::chrono::steady_clock::now() + send_timeout_;
        return queue_.tryWriteUntil(deadline, std::move(message));
    }

    std::optional<M> Receive(std::chrono::milliseconds timeout) {
        M message;
        auto deadline = std::chrono::steady_clock::now() + timeout;
        if (!queue_.tryReadUntil(deadline, message)) {
            return std::nullopt;
        }
        return message;
    }

    size_t size() const {
        auto guess = queue_.sizeGuess();
        return guess > 0 ? static_cast<size_t>(guess) : 0;
    }

    size_t capacity() const { return capacity_; }

private:
    folly::MPMCQueue<M> queue_;
    const size_t capacity_;
    const std::chrono::milliseconds send_timeout_;

    QueueChannel(const QueueChannel&) = delete;
    QueueChannel& operator=(const QueueChannel&) = delete;
};

template<typename T>
using RequestChannel = QueueChannel<ChunkRequest<T>>;
using ReplyChannel = QueueChannel<ChunkResponse>;

// IChunkTarget over a RequestChannel
template<typename T>
class QueueChunkTarget : public IChunkTarget<T> {
public:
    explicit QueueChunkTarget(std::shared_ptr<RequestChannel<T>> channel)
        : channel_(std::move(channel)) {}

    void Send(ChunkRequest<T> request) override {
        JobId job_id = request.job_id();
        size_t item_count = request.size();
        if (!channel_->TrySend(std::move(request))) {
            throw SendFailureError(job_id, item_count,
                    "request channel full (capacity " + std::to_string(channel_->capacity()) + ")");
        }
    }

private:
    std::shared_ptr<RequestChannel<T>> channel_;
};

// IReplySource over a ReplyChannel
class QueueReplySource : public IReplySource {
public:
    explicit QueueReplySource(std::shared_ptr<ReplyChannel> channel)
        : channel_(std::move(channel)) {}

    std::optional<ChunkResponse> Receive(std::chrono::milliseconds timeout) override {
        return channel_->Receive(timeout);
    }

private:
    std::shared_ptr<ReplyChannel> channel_;
};

} // namespace RemoteChunk
