#include "StateTracker.hpp"
#include <gtest/gtest.h>
#include <initializer_list>

namespace {

int feed(StateTracker& tracker, std::initializer_list<StationState> states) {
    int completed = 0;
    for (StationState s : states) {
        if (tracker.update(s).loop_completed) ++completed;
    }
    return completed;
}

} // namespace

TEST(StateTrackerTest, StartsUnknown) {
    StateTracker tracker;
    EXPECT_EQ(tracker.current(), StationState::Unknown);
    EXPECT_EQ(tracker.loop_count(), 0);
    EXPECT_FALSE(tracker.loop_in_progress());
}

TEST(StateTrackerTest, CountsBackToBackLoops) {
    StateTracker tracker;
    int completed = feed(tracker, {
        StationState::Active, StationState::Standby, StationState::Maintenance, StationState::Error,
        StationState::Active, StationState::Standby, StationState::Maintenance, StationState::Error,
        StationState::Active});
    EXPECT_EQ(completed, 2);
    EXPECT_EQ(tracker.loop_count(), 2);
    EXPECT_EQ(tracker.current(), StationState::Active);
    EXPECT_TRUE(tracker.loop_in_progress());
}

TEST(StateTrackerTest, OutOfSequenceTransitionBreaksTheLoop) {
    StateTracker tracker;
    feed(tracker, {StationState::Active, StationState::Standby, StationState::Error});
    EXPECT_FALSE(tracker.loop_in_progress());
    EXPECT_EQ(tracker.loop_count(), 0);

    int completed = feed(tracker, {
        StationState::Active, StationState::Standby, StationState::Maintenance, StationState::Error,
        StationState::Active});
    EXPECT_EQ(completed, 1);
}

TEST(StateTrackerTest, JumpBackToActiveRestartsTheLoop) {
    StateTracker tracker;
    feed(tracker, {StationState::Active, StationState::Standby, StationState::Maintenance, StationState::Active});
    EXPECT_TRUE(tracker.loop_in_progress());
    EXPECT_EQ(tracker.loop_position(), 0u);
}

TEST(StateTrackerTest, LoopMustStartAtActive) {
    StateTracker tracker;
    int completed = feed(tracker, {StationState::Standby, StationState::Maintenance, StationState::Error,
                                   StationState::Active});
    EXPECT_EQ(completed, 0);
    EXPECT_TRUE(tracker.loop_in_progress());
}

TEST(StateTrackerTest, RepeatedStateIsNotAChange) {
    StateTracker tracker;
    tracker.update(StationState::Active);
    StateUpdate u = tracker.update(StationState::Active);
    EXPECT_TRUE(u.success);
    EXPECT_FALSE(u.changed);
    EXPECT_EQ(tracker.history().size(), 1u);
}

TEST(StateTrackerTest, UnknownStateIsRejected) {
    StateTracker tracker;
    tracker.update(StationState::Standby);
    StateUpdate u = tracker.update(StationState::Unknown);
    EXPECT_FALSE(u.success);
    EXPECT_EQ(tracker.current(), StationState::Standby);
}

TEST(StateTrackerTest, HistoryKeepsTransitionsInOrder) {
    StateTracker tracker;
    feed(tracker, {StationState::Active, StationState::Standby, StationState::Maintenance});

    auto all = tracker.history();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].from, StationState::Unknown);
    EXPECT_EQ(all[0].to, StationState::Active);
    EXPECT_EQ(all[2].from, StationState::Standby);
    EXPECT_EQ(all[2].to, StationState::Maintenance);

    auto last = tracker.history(2);
    ASSERT_EQ(last.size(), 2u);
    EXPECT_EQ(last[0].to, StationState::Standby);
    EXPECT_EQ(last[1].to, StationState::Maintenance);
}

TEST(StateTrackerTest, HistoryIsBounded) {
    StateTracker tracker(4);
    for (int i = 0; i < 3; ++i) {
        feed(tracker, {StationState::Active, StationState::Standby, StationState::Maintenance, StationState::Error});
    }

    auto all = tracker.history();
    ASSERT_EQ(all.size(), 4u);
    EXPECT_EQ(all[0].to, StationState::Active);
    EXPECT_EQ(all[3].to, StationState::Error);
    EXPECT_EQ(tracker.loop_count(), 2);
}
