#include "tictac/mcts/node.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>

using namespace tictac;
using tictac::test::make_state;

TEST(MCTSNodeTest, NewNodeIsUnexpandedLeaf) {
    MCTSNode node(nullptr, game::initial_state());
    EXPECT_FALSE(node.is_expanded());
    EXPECT_FALSE(node.has_children());
    EXPECT_TRUE(node.children().empty());
    EXPECT_EQ(node.simulations(), 0);
    EXPECT_DOUBLE_EQ(node.wins(), 0.0);
    EXPECT_EQ(node.parent(), nullptr);
}

TEST(MCTSNodeTest, ExpandCreatesOneChildPerLegalMove) {
    MCTSNode node(nullptr, make_state("X.O/.X./O..", Turn::O));
    node.expand();

    ASSERT_TRUE(node.is_expanded());
    auto moves = game::legal_moves(node.state());
    ASSERT_EQ(node.children().size(), moves.size());

    for (size_t i = 0; i < moves.size(); i++) {
        const MCTSNode& child = *node.children()[i];
        EXPECT_EQ(child.parent(), &node);
        EXPECT_EQ(child.simulations(), 0);
        EXPECT_DOUBLE_EQ(child.wins(), 0.0);
        EXPECT_FALSE(child.is_expanded());
        EXPECT_EQ(child.state(), game::apply(moves[i], node.state()));
    }
}

TEST(MCTSNodeTest, ExpandTwiceIsAnError) {
    MCTSNode node(nullptr, game::initial_state());
    node.expand();
    EXPECT_THROW(node.expand(), std::logic_error);
    EXPECT_EQ(node.children().size(), 9u);
}

TEST(MCTSNodeTest, FullBoardExpandsToTerminalLeaf) {
    MCTSNode node(nullptr, make_state("XOX/XOO/OXX", Turn::O));
    node.expand();
    EXPECT_TRUE(node.is_expanded());
    EXPECT_FALSE(node.has_children());
    EXPECT_EQ(node.subtree_size(), 1);
}

TEST(MCTSNodeTest, UpdateAccumulatesFractionalScores) {
    MCTSNode node(nullptr, game::initial_state());
    node.update(1.0);
    node.update(0.5);
    node.update(0.0);
    EXPECT_EQ(node.simulations(), 3);
    EXPECT_DOUBLE_EQ(node.wins(), 1.5);
    EXPECT_DOUBLE_EQ(node.win_rate(), 0.5);
}

TEST(MCTSNodeTest, UnvisitedNodeHasInfiniteScore) {
    MCTSNode node(nullptr, game::initial_state());
    EXPECT_EQ(node.compute_ucb(10.0, 5), std::numeric_limits<double>::infinity());
    EXPECT_DOUBLE_EQ(node.win_rate(), 0.0);
}

TEST(MCTSNodeTest, UcbCombinesWinRateAndExploration) {
    MCTSNode node(nullptr, game::initial_state());
    node.update(1.0);
    node.update(1.0);
    node.update(1.0);
    node.update(0.0);

    double expected = 0.75 + 10.0 * std::sqrt(std::log(10.0) / 4.0);
    EXPECT_NEAR(node.compute_ucb(10.0, 10), expected, 1e-12);
    EXPECT_NEAR(node.compute_ucb(0.0, 10), 0.75, 1e-12);
}

TEST(MCTSNodeTest, SelectChildPrefersUnvisitedChild) {
    MCTSNode root(nullptr, game::initial_state());
    root.expand();
    for (size_t i = 0; i < root.children().size(); i++) {
        if (i != 4) {
            root.children()[i]->update(1.0);
            root.update(1.0);
        }
    }
    EXPECT_EQ(root.select_child(10.0), root.children()[4].get());
    EXPECT_EQ(root.first_unvisited_child(), root.children()[4].get());
}

TEST(MCTSNodeTest, SelectChildBreaksTiesByEnumerationOrder) {
    MCTSNode root(nullptr, game::initial_state());
    root.expand();
    for (const auto& child : root.children()) {
        child->update(0.5);
        root.update(0.5);
    }
    EXPECT_EQ(root.select_child(10.0), root.children()[0].get());
    EXPECT_EQ(root.first_unvisited_child(), nullptr);
}

TEST(MCTSNodeTest, SelectChildBalancesExploitationAndExploration) {
    MCTSNode root(nullptr, game::initial_state());
    root.expand();
    // Every child visited twice, child 3 won both, the rest lost
    for (size_t i = 0; i < root.children().size(); i++) {
        double result = i == 3 ? 1.0 : 0.0;
        for (int n = 0; n < 2; n++) {
            root.children()[i]->update(result);
            root.update(result);
        }
    }
    EXPECT_EQ(root.select_child(10.0), root.children()[3].get());

    // A heavily sampled winner loses out to an under-sampled sibling
    for (int n = 0; n < 200; n++) {
        root.children()[3]->update(1.0);
        root.update(1.0);
    }
    EXPECT_NE(root.select_child(10.0), root.children()[3].get());
    EXPECT_EQ(root.select_child(0.0), root.children()[3].get());
}

TEST(MCTSNodeTest, MostVisitedChildTakesFirstMaximum) {
    MCTSNode root(nullptr, game::initial_state());
    root.expand();
    root.children()[2]->update(0.0);
    root.children()[2]->update(0.0);
    root.children()[6]->update(1.0);
    root.children()[6]->update(1.0);
    root.children()[7]->update(1.0);

    EXPECT_EQ(root.most_visited_child(), root.children()[2].get());
}

TEST(MCTSNodeTest, FindAndReleaseChild) {
    MCTSNode root(nullptr, game::initial_state());
    root.expand();

    game::State target = game::apply(Move{1, 1}, root.state());
    MCTSNode* child = root.find_child(target.board());
    ASSERT_NE(child, nullptr);
    EXPECT_EQ(child->state(), target);

    std::unique_ptr<MCTSNode> released = root.release_child(child);
    ASSERT_EQ(released.get(), child);
    EXPECT_EQ(released->parent(), nullptr);
    EXPECT_EQ(root.children().size(), 8u);
    EXPECT_EQ(root.find_child(target.board()), nullptr);
    EXPECT_EQ(root.release_child(child), nullptr);
}

TEST(MCTSNodeTest, SubtreeSizeCountsAllNodes) {
    MCTSNode root(nullptr, game::initial_state());
    root.expand();
    root.children()[0]->expand();
    EXPECT_EQ(root.subtree_size(), 1 + 9 + 8);
}
