#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <glog/logging.h>

#include "chunk/queue_channel.h"

namespace RemoteChunk {

/**
 * In-process stand-in for the remote worker pool: N threads pull requests
 * from the request channel and answer on the reply channel.
 * Every chunk after the first fail_after ones is answered FAILED.
 */
template<typename T>
class LoopbackWorker {
public:
    LoopbackWorker(std::shared_ptr<RequestChannel<T>> requests,
                   std::shared_ptr<ReplyChannel> replies,
                   int num_threads,
                   std::chrono::milliseconds delay)
        : requests_(std::move(requests)),
          replies_(std::move(replies)),
          num_threads_(num_threads),
          delay_(delay) {}

    ~LoopbackWorker() {
        Stop();
    }

    void Start() {
        for (int i = 0; i < num_threads_; ++i) {
            threads_.emplace_back(&LoopbackWorker::WorkerThread, this, i);
        }
        VLOG(1) << "LoopbackWorker started " << num_threads_ << " thread(s)";
    }

    void Stop() {
        stop_ = true;
        for (auto& t : threads_) {
            if (t.joinable()) {
                t.join();
            }
        }
        threads_.clear();
    }

    void FailAfter(uint64_t chunks) { fail_after_ = chunks; }

    uint64_t chunks_processed() const { return chunks_processed_.load(); }
    uint64_t items_processed() const { return items_processed_.load(); }

private:
    void WorkerThread(int worker_id) {
        while (!stop_) {
            auto request = requests_->Receive(std::chrono::milliseconds(50));
            if (!request.has_value()) {
                continue;
            }
            if (delay_.count() > 0) {
                std::this_thread::sleep_for(delay_);
            }

            uint64_t seq = chunks_processed_.fetch_add(1) + 1;
            items_processed_.fetch_add(request->size());

            ChunkResponse reply = seq > fail_after_.load()
                    ? ChunkResponse::Failed(request->job_id(),
                            "injected failure at chunk " + std::to_string(seq))
                    : ChunkResponse::Continuable(request->job_id());
            VLOG(2) << "Worker " << worker_id << " answered chunk " << seq << " of "
                    << request->size() << " item(s) with " << reply.status();

            if (!replies_->TrySend(std::move(reply))) {
                LOG(ERROR) << "Worker " << worker_id << ": reply channel full, reply for chunk "
                           << seq << " lost";
            }
        }
    }

    std::shared_ptr<RequestChannel<T>> requests_;
    std::shared_ptr<ReplyChannel> replies_;
    const int num_threads_;
    const std::chrono::milliseconds delay_;

    std::vector<std::thread> threads_;
    std::atomic<bool> stop_{false};
    std::atomic<uint64_t> fail_after_{std::numeric_limits<uint64_t>::max()};
    std::atomic<uint64_t> chunks_processed_{0};
    std::atomic<uint64_t> items_processed_{0};
};

} // namespace RemoteChunk
