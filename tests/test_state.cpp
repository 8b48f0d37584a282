#include <gtest/gtest.h>
#include "search/state.hpp"
#include "search/sequence_state.hpp"

#include <stdexcept>

using namespace statebeam;

// ─── State invariants ──────────────────────────────────────────

TEST(StateTest, MismatchedFieldLengthsRejected) {
    EXPECT_THROW(SequenceState({0, 1}, {{}}, {0.0, 0.0}, {}), std::invalid_argument);
    EXPECT_THROW(SequenceState({0}, {{}}, {0.0, 1.0}, {}), std::invalid_argument);
}

TEST(StateTest, InitialStateOneMemberPerInstance) {
    SequenceState s = SequenceState::initial(3, {9});
    ASSERT_EQ(s.groupSize(), 3u);
    EXPECT_EQ(s.batchIndices(), (std::vector<int>{0, 1, 2}));
    for (size_t i = 0; i < 3; i++) {
        EXPECT_TRUE(s.actionHistories()[i].empty());
        EXPECT_DOUBLE_EQ(s.scores()[i], 0.0);
    }
    EXPECT_THROW(SequenceState::initial(0, {}), std::invalid_argument);
}

// ─── isFinished ────────────────────────────────────────────────

TEST(StateTest, FinishedWhenLastActionTerminal) {
    SequenceState done({0}, {{1, 2, 9}}, {-1.0}, {9});
    SequenceState open({0}, {{9, 2}}, {-1.0}, {9});
    SequenceState empty({0}, {{}}, {0.0}, {9});
    EXPECT_TRUE(done.isFinished());
    EXPECT_FALSE(open.isFinished());
    EXPECT_FALSE(empty.isFinished());
}

TEST(StateTest, IsFinishedOnGroupIsPreconditionViolation) {
    SequenceState group({0, 0}, {{9}, {9}}, {0.0, 0.0}, {9});
    EXPECT_THROW(group.isFinished(), std::logic_error);
}

// ─── combineStates ─────────────────────────────────────────────

TEST(StateTest, CombinePreservesOrderAndSumsGroupSizes) {
    SequenceState a({0}, {{1}}, {-0.5}, {9});
    SequenceState b({1, 0}, {{2}, {3, 4}}, {-1.0, -2.0}, {9});
    SequenceState c({2}, {{5}}, {-3.0}, {9});

    SequenceState combined = a.combineStates({a, b, c});
    ASSERT_EQ(combined.groupSize(), 4u);
    EXPECT_EQ(combined.batchIndices(), (std::vector<int>{0, 1, 0, 2}));
    EXPECT_EQ(combined.actionHistories()[2], (ActionHistory{3, 4}));
    EXPECT_DOUBLE_EQ(combined.scores()[3], -3.0);
}

TEST(StateTest, CombineRejectsEmptyAndMismatchedTerminals) {
    SequenceState a({0}, {{1}}, {0.0}, {9});
    SequenceState other({0}, {{1}}, {0.0}, {7});
    EXPECT_THROW(a.combineStates({}), std::invalid_argument);
    EXPECT_THROW(a.combineStates({a, other}), std::invalid_argument);
}

// ─── member / extend ───────────────────────────────────────────

TEST(StateTest, MemberAndExtend) {
    SequenceState group({0, 1}, {{1}, {2}}, {-1.0, -2.0}, {9});

    SequenceState second = group.member(1);
    EXPECT_EQ(second.groupSize(), 1u);
    EXPECT_EQ(second.batchIndices()[0], 1);
    EXPECT_THROW(group.member(2), std::logic_error);

    SequenceState child = group.extend(1, 9, -0.25);
    EXPECT_EQ(child.actionHistories()[0], (ActionHistory{2, 9}));
    EXPECT_DOUBLE_EQ(child.scores()[0], -2.25);
    EXPECT_TRUE(child.isFinished());
    // Parent untouched
    EXPECT_EQ(group.actionHistories()[1], (ActionHistory{2}));
}
