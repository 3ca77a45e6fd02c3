#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/chunk/chunk_dispatcher.h"
#include "../../src/chunk/queue_channel.h"
#include "test_doubles.h"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace RemoteChunk;
using namespace RemoteChunk::testing_support;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Property;
using ::testing::Throw;

namespace {
constexpr JobId kJob = 11;

CoordinatorOptions FastOptions(int64_t throttle_limit) {
    CoordinatorOptions options;
    options.throttle_limit = throttle_limit;
    options.poll_interval = std::chrono::milliseconds(1);
    options.flush_poll_timeout = std::chrono::milliseconds(0);
    return options;
}
}

class ChunkDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        state_.SetJob(kJob, 4);
    }

    void Stage(TransactionId txn, std::vector<std::string> items) {
        for (auto& item : items) {
            buffer_.Append(txn, std::move(item));
        }
    }

    RecordingTarget<std::string> target_;
    ScriptedReplySource source_;
    TransactionalItemBuffer<std::string> buffer_;
    ProgressState state_;
    ReplyDrain drain_{source_, state_};
};

// Test 1: One flush sends one request carrying the staged items in order
TEST_F(ChunkDispatcherTest, FlushSendsOneChunk) {
    ChunkDispatcher<std::string> dispatcher(target_, buffer_, state_, drain_, FastOptions(6));
    TransactionId txn{1};
    Stage(txn, {"a", "b", "c", "d", "e"});

    EXPECT_EQ(dispatcher.Flush(txn), 5u);

    auto sent = target_.sent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_THAT(sent[0].items(), ElementsAre("a", "b", "c", "d", "e"));
    EXPECT_EQ(sent[0].job_id(), kJob);
    EXPECT_EQ(sent[0].skip_count(), 4);
    EXPECT_EQ(state_.expected(), 1u);
    EXPECT_EQ(dispatcher.chunks_sent(), 1u);
    EXPECT_FALSE(buffer_.IsBound(txn)) << "Staged list must be released after flush";
}

// Test 2: An empty flush sends nothing but still looks for a reply
TEST_F(ChunkDispatcherTest, EmptyFlushSendsNothing) {
    ChunkDispatcher<std::string> dispatcher(target_, buffer_, state_, drain_, FastOptions(6));
    TransactionId txn{2};

    EXPECT_EQ(dispatcher.Flush(txn), 0u);

    EXPECT_EQ(target_.send_count(), 0u);
    EXPECT_EQ(state_.expected(), 0u);
    EXPECT_EQ(source_.receive_calls(), 1u);
    EXPECT_FALSE(buffer_.IsBound(txn));
}

// Test 3: The post-send poll picks up an immediate reply
TEST_F(ChunkDispatcherTest, FlushCountsImmediateReply) {
    ChunkDispatcher<std::string> dispatcher(target_, buffer_, state_, drain_, FastOptions(6));
    TransactionId txn{3};
    Stage(txn, {"x"});
    source_.Push(ChunkResponse::Continuable(kJob));

    dispatcher.Flush(txn);

    EXPECT_EQ(state_.expected(), 1u);
    EXPECT_EQ(state_.actual(), 1u);
}

// Test 4: A rejected send propagates and does not count as dispatched
TEST_F(ChunkDispatcherTest, SendFailurePropagates) {
    ChunkDispatcher<std::string> dispatcher(target_, buffer_, state_, drain_, FastOptions(6));
    TransactionId txn{4};
    Stage(txn, {"x", "y"});
    target_.Reject(true);

    EXPECT_THROW(dispatcher.Flush(txn), SendFailureError);

    EXPECT_EQ(state_.expected(), 0u);
    EXPECT_EQ(dispatcher.chunks_sent(), 0u);
    EXPECT_FALSE(buffer_.IsBound(txn)) << "Staged list must be released on failure too";
}

// Test 5: A failure reply seen right after sending fails the flush
TEST_F(ChunkDispatcherTest, AsynchronousFailureDuringFlush) {
    ChunkDispatcher<std::string> dispatcher(target_, buffer_, state_, drain_, FastOptions(6));
    TransactionId txn{5};
    Stage(txn, {"x"});
    source_.Push(ChunkResponse::Failed(kJob, "worker crashed"));

    EXPECT_THROW(dispatcher.Flush(txn), AsynchronousFailureError);

    EXPECT_EQ(target_.send_count(), 1u) << "The chunk was sent before the failure was seen";
    EXPECT_EQ(state_.expected(), 1u);
    EXPECT_FALSE(buffer_.IsBound(txn));
}

// Test 6: Flushing without a transaction is a buffer-state error
TEST_F(ChunkDispatcherTest, FlushWithoutTransaction) {
    ChunkDispatcher<std::string> dispatcher(target_, buffer_, state_, drain_, FastOptions(6));

    EXPECT_THROW(dispatcher.Flush(TransactionId{}), BufferStateError);
    EXPECT_EQ(target_.send_count(), 0u);
}

// Test 7: With throttle_limit 2 the third flush sends only after a reply
TEST_F(ChunkDispatcherTest, ThrottleBlocksThirdChunk) {
    ChunkDispatcher<std::string> dispatcher(target_, buffer_, state_, drain_, FastOptions(2));

    Stage(TransactionId{1}, {"a"});
    dispatcher.Flush(TransactionId{1});
    Stage(TransactionId{2}, {"b"});
    dispatcher.Flush(TransactionId{2});
    ASSERT_EQ(target_.send_count(), 2u);
    ASSERT_EQ(state_.Outstanding(), 2u);

    // Record how many chunks had been sent at each empty poll; the third
    // empty poll finally delivers a reply.
    std::vector<size_t> sent_at_poll;
    source_.OnEmpty([&]() {
        sent_at_poll.push_back(target_.send_count());
        if (sent_at_poll.size() == 3) {
            source_.Push(ChunkResponse::Continuable(kJob));
        }
    });

    Stage(TransactionId{3}, {"c"});
    dispatcher.Flush(TransactionId{3});

    ASSERT_GE(sent_at_poll.size(), 3u);
    for (size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(sent_at_poll[i], 2u) << "Third chunk must not be sent while two are in flight (poll " << i << ")";
    }
    EXPECT_EQ(target_.send_count(), 3u);
    EXPECT_EQ(state_.expected(), 3u);
    EXPECT_EQ(state_.actual(), 1u);
    EXPECT_LE(state_.Outstanding(), 2u);
}

// Test 8: Same property across threads, with a real reply channel
TEST_F(ChunkDispatcherTest, ThrottleBlocksUntilWorkerReplies) {
    auto replies = std::make_shared<ReplyChannel>(16, std::chrono::milliseconds(100));
    QueueReplySource reply_source(replies);
    ProgressState state;
    state.SetJob(kJob, 0);
    ReplyDrain drain(reply_source, state);
    ChunkDispatcher<std::string> dispatcher(target_, buffer_, state, drain, FastOptions(2));

    for (uint64_t t = 1; t <= 2; ++t) {
        buffer_.Append(TransactionId{t}, "item");
        dispatcher.Flush(TransactionId{t});
    }
    ASSERT_EQ(target_.send_count(), 2u);

    std::atomic<bool> flushed{false};
    buffer_.Append(TransactionId{3}, "item");
    std::thread step_thread([&]() {
        dispatcher.Flush(TransactionId{3});
        flushed = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_FALSE(flushed.load());
    EXPECT_EQ(target_.send_count(), 2u) << "Flush must block while the throttle window is full";

    ASSERT_TRUE(replies->TrySend(ChunkResponse::Continuable(kJob)));
    step_thread.join();

    EXPECT_TRUE(flushed.load());
    EXPECT_EQ(target_.send_count(), 3u);
}

// Test 9: The request handed to the target is built from the progress state
TEST_F(ChunkDispatcherTest, RequestCarriesJobIdentity) {
    MockChunkTarget<std::string> mock;
    ChunkDispatcher<std::string> dispatcher(mock, buffer_, state_, drain_, FastOptions(6));
    Stage(TransactionId{9}, {"p", "q"});

    EXPECT_CALL(mock, Send(::testing::AllOf(
            Property(&ChunkRequest<std::string>::job_id, kJob),
            Property(&ChunkRequest<std::string>::skip_count, 4),
            Property(&ChunkRequest<std::string>::items, ElementsAre("p", "q")))))
        .Times(1);

    EXPECT_EQ(dispatcher.Flush(TransactionId{9}), 2u);
}

// Test 10: A transport exception surfaces unchanged from the target
TEST_F(ChunkDispatcherTest, TargetExceptionSurfaces) {
    MockChunkTarget<std::string> mock;
    ChunkDispatcher<std::string> dispatcher(mock, buffer_, state_, drain_, FastOptions(6));
    Stage(TransactionId{10}, {"p"});

    EXPECT_CALL(mock, Send(_)).WillOnce(Throw(SendFailureError(kJob, 1, "broker unavailable")));

    try {
        dispatcher.Flush(TransactionId{10});
        FAIL() << "Expected SendFailureError";
    } catch (const SendFailureError& e) {
        EXPECT_EQ(e.item_count(), 1u);
        EXPECT_THAT(e.what(), ::testing::HasSubstr("broker unavailable"));
    }
    EXPECT_EQ(state_.expected(), 0u);
}

// Test 11: A failure reply while the third chunk waits for room fails the flush before sending
TEST_F(ChunkDispatcherTest, ThrottledFlushRaisesFailure) {
    ChunkDispatcher<std::string> dispatcher(target_, buffer_, state_, drain_, FastOptions(2));
    Stage(TransactionId{1}, {"a"});
    dispatcher.Flush(TransactionId{1});
    Stage(TransactionId{2}, {"b"});
    dispatcher.Flush(TransactionId{2});
    ASSERT_EQ(state_.Outstanding(), 2u);

    int empty_polls = 0;
    source_.OnEmpty([&]() {
        if (++empty_polls == 2) {
            source_.Push(ChunkResponse::Failed(kJob, "chunk rejected"));
        }
    });
    Stage(TransactionId{3}, {"c"});

    EXPECT_THROW(dispatcher.Flush(TransactionId{3}), AsynchronousFailureError);

    EXPECT_EQ(target_.send_count(), 2u) << "The throttled chunk must not be sent";
    EXPECT_EQ(state_.expected(), 2u);
    EXPECT_FALSE(buffer_.IsBound(TransactionId{3})) << "Staged list must be released when the throttle fails";
}

// Test 12: Same for a reply addressed to another job
TEST_F(ChunkDispatcherTest, ThrottledFlushRejectsWrongJob) {
    ChunkDispatcher<std::string> dispatcher(target_, buffer_, state_, drain_, FastOptions(1));
    Stage(TransactionId{1}, {"a"});
    dispatcher.Flush(TransactionId{1});
    ASSERT_EQ(state_.Outstanding(), 1u);

    source_.Push(ChunkResponse::Continuable(kJob + 100));
    Stage(TransactionId{2}, {"b"});

    EXPECT_THROW(dispatcher.Flush(TransactionId{2}), ValidationError);

    EXPECT_EQ(target_.send_count(), 1u);
    EXPECT_EQ(state_.actual(), 0u);
    EXPECT_FALSE(buffer_.IsBound(TransactionId{2}));
}
