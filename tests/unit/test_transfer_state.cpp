#include <gtest/gtest.h>
#include "pqshare/transfer/chunk_tracker.hpp"
#include "pqshare/transfer/transfer_state.hpp"

using namespace pqshare::transfer;
using pqshare::core::TimePoint;

class TransferStateTest : public ::testing::Test {};

TEST_F(TransferStateTest, StateMachine_HappyPath) {
    SessionStateMachine machine;
    EXPECT_EQ(machine.get_state(), SessionState::PENDING);
    EXPECT_TRUE(machine.transition(SessionState::NEGOTIATING));
    EXPECT_TRUE(machine.transition(SessionState::TRANSFERRING));
    EXPECT_TRUE(machine.transition(SessionState::PAUSED));
    EXPECT_TRUE(machine.transition(SessionState::TRANSFERRING));
    EXPECT_TRUE(machine.transition(SessionState::COMPLETED));
    EXPECT_TRUE(machine.is_terminal());
}

TEST_F(TransferStateTest, StateMachine_RejectsIllegalTransitions) {
    SessionStateMachine machine;
    auto result = machine.transition(SessionState::TRANSFERRING);
    EXPECT_EQ(result.error, TransferError::INVALID_STATE);
    EXPECT_EQ(machine.get_state(), SessionState::PENDING);

    EXPECT_FALSE(machine.transition(SessionState::COMPLETED));
    EXPECT_FALSE(machine.transition(SessionState::PAUSED));
    EXPECT_TRUE(machine.transition(SessionState::CANCELLED));

    for (auto next : {SessionState::PENDING, SessionState::NEGOTIATING, SessionState::TRANSFERRING,
                      SessionState::PAUSED, SessionState::COMPLETED, SessionState::FAILED}) {
        EXPECT_FALSE(machine.transition(next)) << to_string(next);
    }
    EXPECT_EQ(machine.get_state(), SessionState::CANCELLED);
}

TEST_F(TransferStateTest, StateMachine_RestoredSessionsStartPaused) {
    SessionStateMachine machine(SessionState::PAUSED);
    EXPECT_FALSE(machine.transition(SessionState::COMPLETED));
    EXPECT_TRUE(machine.transition(SessionState::TRANSFERRING));
    EXPECT_TRUE(can_transition(SessionState::NEGOTIATING, SessionState::FAILED));
    EXPECT_FALSE(can_transition(SessionState::COMPLETED, SessionState::FAILED));
}

class ChunkTrackerTest : public ::testing::Test {
protected:
    static constexpr std::chrono::milliseconds TIMEOUT{30000};
    TimePoint now_ = pqshare::core::Clock::now();
};

TEST_F(ChunkTrackerTest, Tracker_SendsInIndexOrder) {
    ChunkTracker tracker(4, 3, TIMEOUT);
    std::vector<std::uint32_t> sent;
    while (auto next = tracker.next_pending()) {
        tracker.mark_in_flight(*next, now_);
        sent.push_back(*next);
    }
    EXPECT_EQ(sent, (std::vector<std::uint32_t>{0, 1, 2, 3}));
    EXPECT_EQ(tracker.in_flight_count(), 4u);
    EXPECT_THROW(tracker.mark_in_flight(0, now_), std::logic_error);
}

TEST_F(ChunkTrackerTest, Tracker_AcknowledgeMeasuresRtt) {
    ChunkTracker tracker(2, 3, TIMEOUT);
    tracker.mark_in_flight(0, now_);

    auto record = tracker.acknowledge(0, now_ + std::chrono::milliseconds(40));
    EXPECT_EQ(record.outcome, AckOutcome::ACKNOWLEDGED);
    ASSERT_TRUE(record.rtt.has_value());
    EXPECT_EQ(record.rtt->count(), 40000);

    EXPECT_EQ(tracker.acknowledge(0, now_).outcome, AckOutcome::DUPLICATE);
    EXPECT_EQ(tracker.acknowledge(1, now_).outcome, AckOutcome::UNEXPECTED);
    EXPECT_EQ(tracker.acknowledge(9, now_).outcome, AckOutcome::UNEXPECTED);
    EXPECT_EQ(tracker.acknowledged_count(), 1u);
}

TEST_F(ChunkTrackerTest, Tracker_TimeoutRequeuesUntilRetryLimit) {
    ChunkTracker tracker(1, 2, TIMEOUT);
    auto t = now_;
    for (std::uint32_t attempt = 1; attempt <= 2; ++attempt) {
        tracker.mark_in_flight(0, t);
        EXPECT_EQ(tracker.next_deadline(), t + TIMEOUT);
        t += TIMEOUT;
        std::uint32_t timed_out = 0;
        EXPECT_TRUE(tracker.expire(t, &timed_out).empty());
        EXPECT_EQ(timed_out, 1u);
        EXPECT_EQ(tracker.get_state(0), ChunkState::PENDING);
        EXPECT_EQ(tracker.get_retries(0), attempt);
    }

    tracker.mark_in_flight(0, t);
    auto exhausted = tracker.expire(t + TIMEOUT);
    ASSERT_EQ(exhausted.size(), 1u);
    EXPECT_EQ(tracker.get_state(0), ChunkState::FAILED);
    EXPECT_EQ(tracker.failed_count(), 1u);
    EXPECT_FALSE(tracker.next_pending().has_value());
}

TEST_F(ChunkTrackerTest, Tracker_RetransmissionHasNoRttSample) {
    ChunkTracker tracker(1, 3, TIMEOUT);
    tracker.mark_in_flight(0, now_);
    EXPECT_TRUE(tracker.requeue(0));
    tracker.mark_in_flight(0, now_ + std::chrono::seconds(1));

    auto record = tracker.acknowledge(0, now_ + std::chrono::seconds(2));
    EXPECT_EQ(record.outcome, AckOutcome::ACKNOWLEDGED);
    EXPECT_FALSE(record.rtt.has_value());
    EXPECT_TRUE(tracker.all_acknowledged());
}

TEST_F(ChunkTrackerTest, Tracker_ResumeMarksHeldChunks) {
    ChunkTracker tracker(5, 3, TIMEOUT);
    pqshare::storage::ChunkBitmap held(5);
    held.set(0);
    held.set(1);
    held.set(2);
    tracker.mark_acknowledged(held);

    std::vector<std::uint32_t> sent;
    while (auto next = tracker.next_pending()) {
        tracker.mark_in_flight(*next, now_);
        sent.push_back(*next);
    }
    EXPECT_EQ(sent, (std::vector<std::uint32_t>{3, 4}));

    EXPECT_THROW(tracker.mark_acknowledged(pqshare::storage::ChunkBitmap(4)), std::invalid_argument);
}

TEST_F(ChunkTrackerTest, Tracker_RevertInFlightIsFree) {
    ChunkTracker tracker(3, 1, TIMEOUT);
    tracker.mark_in_flight(0, now_);
    tracker.mark_in_flight(1, now_);
    tracker.revert_in_flight();

    EXPECT_EQ(tracker.in_flight_count(), 0u);
    EXPECT_EQ(tracker.get_retries(0), 0u);
    EXPECT_EQ(tracker.next_pending(), 0u);
    EXPECT_FALSE(tracker.next_deadline().has_value());
}

TEST_F(ChunkTrackerTest, Tracker_DeadlinesFollowSendOrder) {
    ChunkTracker tracker(5000, 3, TIMEOUT);
    for (std::uint32_t i = 0; i < 5000; ++i) {
        tracker.mark_in_flight(i, now_ + std::chrono::milliseconds(i));
    }
    EXPECT_EQ(tracker.next_deadline(), now_ + TIMEOUT);

    // Acknowledged and requeued chunks leave the deadline order
    tracker.acknowledge(0, now_ + std::chrono::seconds(1));
    EXPECT_TRUE(tracker.requeue(1));
    EXPECT_EQ(tracker.next_deadline(), now_ + TIMEOUT + std::chrono::milliseconds(2));

    std::uint32_t timed_out = 0;
    EXPECT_TRUE(tracker.expire(now_ + TIMEOUT + std::chrono::milliseconds(10), &timed_out).empty());
    EXPECT_EQ(timed_out, 9u);
    EXPECT_EQ(tracker.get_state(10), ChunkState::PENDING);
    EXPECT_EQ(tracker.get_state(11), ChunkState::IN_FLIGHT);
    EXPECT_EQ(tracker.in_flight_count(), 4989u);
    EXPECT_EQ(tracker.next_deadline(), now_ + TIMEOUT + std::chrono::milliseconds(11));

    EXPECT_EQ(tracker.expire(now_ + TIMEOUT + std::chrono::milliseconds(10)).size(), 0u);
    tracker.revert_in_flight();
    EXPECT_FALSE(tracker.next_deadline().has_value());
    EXPECT_EQ(tracker.next_pending(), 1u);
}
