#include <gtest/gtest.h>
#include "../../src/chunk/chunk_error.h"
#include "../../src/chunk/execution_context.h"
#include "../../src/chunk/progress_state.h"

using namespace RemoteChunk;

class ProgressStateTest : public ::testing::Test {
protected:
    ProgressState state_;
    ExecutionContext context_;
};

// Test 1: Fresh state has nothing outstanding and no job
TEST_F(ProgressStateTest, InitialState) {
    EXPECT_EQ(state_.expected(), 0u);
    EXPECT_EQ(state_.actual(), 0u);
    EXPECT_EQ(state_.Outstanding(), 0u);
    EXPECT_FALSE(state_.has_job());
}

// Test 2: Dispatches and replies move the counters
TEST_F(ProgressStateTest, DispatchAndReply) {
    state_.SetJob(42, 3);
    state_.RecordDispatch();
    state_.RecordDispatch();
    EXPECT_TRUE(state_.RecordReply());

    EXPECT_EQ(state_.expected(), 2u);
    EXPECT_EQ(state_.actual(), 1u);
    EXPECT_EQ(state_.Outstanding(), 1u);
    EXPECT_EQ(state_.job_id(), 42);
    EXPECT_EQ(state_.skip_count(), 3);
}

// Test 3: A surplus reply is not counted, so actual never exceeds expected
TEST_F(ProgressStateTest, SurplusReplyIsNotCounted) {
    state_.RecordDispatch();
    EXPECT_TRUE(state_.RecordReply());
    EXPECT_FALSE(state_.RecordReply());

    EXPECT_EQ(state_.actual(), 1u);
    EXPECT_EQ(state_.Outstanding(), 0u);
}

// Test 4: Both keys are written together
TEST_F(ProgressStateTest, SaveWritesBothKeys) {
    state_.RecordDispatch();
    state_.RecordDispatch();
    state_.RecordDispatch();
    state_.RecordReply();

    state_.SaveTo(context_);

    EXPECT_EQ(context_.GetLong(kExpectedKey).value_or(0), 3u);
    EXPECT_EQ(context_.GetLong(kActualKey).value_or(0), 1u);
    EXPECT_EQ(context_.size(), 2u);
}

// Test 5: An empty context means a fresh run
TEST_F(ProgressStateTest, RestoreFromEmptyContext) {
    state_.RecordDispatch();
    EXPECT_FALSE(state_.RestoreFrom(context_));
    EXPECT_EQ(state_.expected(), 1u) << "Counters must be untouched when nothing was checkpointed";
}

// Test 6: Restoring a checkpoint replaces the counters
TEST_F(ProgressStateTest, RestoreFromCheckpoint) {
    context_.PutLong(kExpectedKey, 7);
    context_.PutLong(kActualKey, 4);

    EXPECT_TRUE(state_.RestoreFrom(context_));
    EXPECT_EQ(state_.expected(), 7u);
    EXPECT_EQ(state_.actual(), 4u);
    EXPECT_EQ(state_.Outstanding(), 3u);
}

// Test 7: Half a checkpoint is rejected
TEST_F(ProgressStateTest, RestoreWithOneKeyFails) {
    context_.PutLong(kExpectedKey, 2);
    EXPECT_THROW(state_.RestoreFrom(context_), ValidationError);

    ExecutionContext only_actual;
    only_actual.PutLong(kActualKey, 2);
    EXPECT_THROW(state_.RestoreFrom(only_actual), ValidationError);
}

// Test 8: ACTUAL > EXPECTED is rejected and leaves the counters alone
TEST_F(ProgressStateTest, RestoreInconsistentPairFails) {
    context_.PutLong(kExpectedKey, 1);
    context_.PutLong(kActualKey, 2);

    EXPECT_THROW(state_.RestoreFrom(context_), ValidationError);
    EXPECT_EQ(state_.expected(), 0u);
    EXPECT_EQ(state_.actual(), 0u);
}

// Test 9: Reset keeps the job, Clear forgets it
TEST_F(ProgressStateTest, ResetAndClear) {
    state_.SetJob(9, 1);
    state_.RecordDispatch();

    state_.Reset();
    EXPECT_EQ(state_.Outstanding(), 0u);
    EXPECT_EQ(state_.job_id(), 9);
    EXPECT_TRUE(state_.has_job());

    state_.Clear();
    EXPECT_EQ(state_.job_id(), 0);
    EXPECT_EQ(state_.skip_count(), 0);
    EXPECT_FALSE(state_.has_job());
}

// Test 10: Checkpoint store basics
TEST(ExecutionContextTest, PutGetRemove) {
    ExecutionContext context;
    EXPECT_TRUE(context.empty());
    EXPECT_FALSE(context.GetLong("missing").has_value());

    context.PutLong("k", 5);
    context.PutLong("k", 6);
    EXPECT_TRUE(context.ContainsKey("k"));
    EXPECT_EQ(context.GetLong("k").value_or(0), 6u);
    EXPECT_EQ(context.size(), 1u);

    context.Remove("k");
    EXPECT_FALSE(context.ContainsKey("k"));
}
