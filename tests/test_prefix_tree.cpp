#include <gtest/gtest.h>
#include "search/prefix_tree.hpp"

#include <stdexcept>

using namespace statebeam;

TEST(PrefixTreeTest, SingleSequence) {
    auto trees = constructPrefixTree({{{4, 5, 6}}});
    ASSERT_EQ(trees.size(), 1u);
    const PrefixTree& tree = trees[0];

    EXPECT_EQ(tree.size(), 3u);
    ASSERT_NE(tree.allowed({}), nullptr);
    EXPECT_EQ(*tree.allowed({}), (std::set<ActionId>{4}));
    EXPECT_EQ(*tree.allowed({4}), (std::set<ActionId>{5}));
    EXPECT_EQ(*tree.allowed({4, 5}), (std::set<ActionId>{6}));

    // The full sequence has no continuation
    EXPECT_EQ(tree.allowed({4, 5, 6}), nullptr);
    EXPECT_FALSE(tree.contains({5}));
}

TEST(PrefixTreeTest, AlternativesShareBranches) {
    auto trees = constructPrefixTree({{{1, 2, 3}, {1, 4}}});
    const PrefixTree& tree = trees[0];

    EXPECT_EQ(*tree.allowed({}), (std::set<ActionId>{1}));
    EXPECT_EQ(*tree.allowed({1}), (std::set<ActionId>{2, 4}));
    EXPECT_EQ(*tree.allowed({1, 2}), (std::set<ActionId>{3}));
    EXPECT_FALSE(tree.contains({1, 4}));
}

TEST(PrefixTreeTest, OneTreePerInstance) {
    auto trees = constructPrefixTree({{{1}}, {{2, 3}}});
    ASSERT_EQ(trees.size(), 2u);
    EXPECT_EQ(*trees[0].allowed({}), (std::set<ActionId>{1}));
    EXPECT_EQ(*trees[1].allowed({}), (std::set<ActionId>{2}));
    EXPECT_FALSE(trees[0].contains({2}));
}

TEST(PrefixTreeTest, MaskEndsSequence) {
    // Second sequence is padded after its first action
    auto trees = constructPrefixTree({{{1, 2, 3}, {7, 0, 0}}},
                                     {{{1, 1, 1}, {1, 0, 0}}});
    const PrefixTree& tree = trees[0];

    EXPECT_EQ(*tree.allowed({}), (std::set<ActionId>{1, 7}));
    EXPECT_FALSE(tree.contains({7}));
    EXPECT_TRUE(tree.contains({1, 2}));
}

TEST(PrefixTreeTest, MaskShapeMismatchThrows) {
    EXPECT_THROW(constructPrefixTree({{{1}}, {{2}}}, {{{1}}}), std::invalid_argument);
    EXPECT_THROW(constructPrefixTree({{{1}, {2}}}, {{{1}}}), std::invalid_argument);
    EXPECT_THROW(constructPrefixTree({{{1, 2}}}, {{{1}}}), std::invalid_argument);
}

TEST(PrefixTreeTest, EmptyInputs) {
    EXPECT_TRUE(constructPrefixTree({}).empty());
    auto trees = constructPrefixTree({{{}}});
    ASSERT_EQ(trees.size(), 1u);
    EXPECT_TRUE(trees[0].empty());
}

TEST(PrefixTreeTest, ManualAdd) {
    PrefixTree tree;
    tree.add({}, 3);
    tree.add({}, 3);
    tree.add({3}, 8);
    EXPECT_EQ(tree.size(), 2u);
    EXPECT_EQ(tree.allowed({})->size(), 1u);
}
