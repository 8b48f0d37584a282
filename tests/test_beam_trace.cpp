#include <gtest/gtest.h>
#include "search/beam_trace.hpp"

using namespace statebeam;

TEST(BeamTraceTest, AppendStepsPerBatch) {
    BeamTrace trace;
    EXPECT_TRUE(trace.empty());

    trace.appendStep(0, {{-1.0, {1}}, {-2.0, {2}}});
    trace.appendStep(0, {{-1.5, {1, 1}}});
    trace.appendStep(3, {{-0.5, {4}}});

    EXPECT_EQ(trace.numSteps(0), 2u);
    EXPECT_EQ(trace.numSteps(3), 1u);
    EXPECT_EQ(trace.numSteps(1), 0u);
    EXPECT_EQ(trace.batchIndices(), (std::vector<int>{0, 3}));
    EXPECT_EQ(trace.steps(0)[1][0].second, (ActionHistory{1, 1}));
}

TEST(BeamTraceTest, AddFinishedByDepthGrowsTrace) {
    BeamTrace trace;
    trace.appendStep(0, {{-1.0, {1}}});

    trace.addFinished(0, -4.0, {1, 2, 3});
    ASSERT_EQ(trace.numSteps(0), 3u);
    EXPECT_TRUE(trace.steps(0)[1].empty());
    ASSERT_EQ(trace.steps(0)[2].size(), 1u);
    EXPECT_DOUBLE_EQ(trace.steps(0)[2][0].first, -4.0);

    trace.addFinished(0, -0.5, {9});
    EXPECT_EQ(trace.steps(0)[0].size(), 2u);

    // Nothing to place for an empty history
    trace.addFinished(0, 0.0, {});
    EXPECT_EQ(trace.numSteps(0), 3u);
}

TEST(BeamTraceTest, ClearRemovesEverything) {
    BeamTrace trace;
    trace.appendStep(0, {});
    trace.appendStep(1, {});
    trace.clear();
    EXPECT_TRUE(trace.empty());
    EXPECT_TRUE(trace.steps(0).empty());
}
