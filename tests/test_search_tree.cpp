#include <gtest/gtest.h>
#include "connectk/errors.hpp"
#include "connectk/game_state.hpp"
#include "connectk/rules.hpp"
#include "connectk_ai/search_tree.hpp"

using namespace connectk;
using namespace connectk_ai;

TEST(SearchTreeTest, FreshRootHoldsEveryLegalMove) {
  SearchTree tree(GameState(5, 4, 3));
  const SearchNode& root = tree.root_node();

  EXPECT_EQ(tree.size(), 1u);
  EXPECT_EQ(root.parent, kNoNode);
  EXPECT_EQ(root.visits, 0u);
  EXPECT_EQ(root.untried_moves.size(), 5u);
  EXPECT_TRUE(root.children.empty());
  EXPECT_FALSE(root.terminal);
  EXPECT_EQ(root.status(), NodeStatus::Unexpanded);
  EXPECT_NO_THROW(tree.check_invariants());
}

TEST(SearchTreeTest, MidGameRoot) {
  GameState s(7, 6, 4, {0, 0, 0, 0, 0, 0, 3});
  SearchTree tree(s);
  EXPECT_EQ(tree.root_node().untried_moves.size(), 6u);
  EXPECT_EQ(tree.root_node().state, s);
}

TEST(SearchTreeTest, TerminalRootHasNothingToExpand) {
  SearchTree tree(GameState(7, 6, 4, {0, 1, 0, 1, 0, 1, 0}));
  EXPECT_TRUE(tree.root_node().terminal);
  EXPECT_TRUE(tree.root_node().untried_moves.empty());
  EXPECT_NO_THROW(tree.check_invariants());
}

TEST(SearchTreeTest, AddChildMovesAnUntriedMove) {
  SearchTree tree;
  NodeId child = tree.add_child(tree.root(), 2);

  const SearchNode& root = tree.root_node();
  const SearchNode& c = tree.node(child);
  EXPECT_EQ(c.move_from_parent, Move(2));
  EXPECT_EQ(c.parent, tree.root());
  EXPECT_EQ(c.visits, 0u);
  EXPECT_DOUBLE_EQ(c.total_reward, 0.0);
  EXPECT_EQ(c.state, Rules::apply_move(root.state, Move(2)));
  EXPECT_EQ(c.untried_moves.size(), 7u);

  EXPECT_EQ(root.untried_moves.size(), 6u);
  EXPECT_EQ(root.children.size(), 1u);
  EXPECT_EQ(root.status(), NodeStatus::PartiallyExpanded);
  EXPECT_EQ(tree.find_child(tree.root(), Move(2)), child);
  EXPECT_EQ(tree.find_child(tree.root(), Move(3)), kNoNode);
  EXPECT_NO_THROW(tree.check_invariants());

  EXPECT_THROW(tree.add_child(tree.root(), 6), SearchInvariantError);
}

TEST(SearchTreeTest, ExpandingEveryMoveFullyExpands) {
  SearchTree tree(GameState(3, 3, 3));
  while (!tree.root_node().untried_moves.empty()) {
    tree.add_child(tree.root(), 0);
  }
  EXPECT_EQ(tree.root_node().status(), NodeStatus::FullyExpanded);
  EXPECT_EQ(tree.size(), 4u);
  EXPECT_EQ(tree.depth(), 1);
}

TEST(SearchTreeTest, AdvanceRootKeepsSubtreeStatistics) {
  SearchTree tree;
  NodeId a = tree.add_child(tree.root(), 0);       // column 0
  NodeId b = tree.add_child(tree.root(), 0);       // column 1
  NodeId a1 = tree.add_child(a, 4);                // column 4 under column 0
  tree.add_child(b, 0);

  tree.node(a1).visits = 3;
  tree.node(a1).total_reward = 2.0;
  tree.node(a).visits = 5;
  tree.node(a).total_reward = -1.0;
  tree.node(b).visits = 2;
  tree.node(tree.root()).visits = 7;
  ASSERT_NO_THROW(tree.check_invariants());
  ASSERT_EQ(tree.size(), 5u);

  tree.advance_root(Move(0));

  const SearchNode& root = tree.root_node();
  EXPECT_EQ(tree.size(), 2u);
  EXPECT_EQ(root.parent, kNoNode);
  EXPECT_EQ(root.visits, 5u);
  EXPECT_DOUBLE_EQ(root.total_reward, -1.0);
  EXPECT_EQ(root.state.history().size(), 1u);

  NodeId kept = tree.find_child(tree.root(), Move(4));
  ASSERT_NE(kept, kNoNode);
  EXPECT_EQ(tree.node(kept).visits, 3u);
  EXPECT_EQ(tree.node(kept).parent, tree.root());
  EXPECT_NO_THROW(tree.check_invariants());
}

TEST(SearchTreeTest, AdvanceRootThroughUnexpandedMove) {
  SearchTree tree;
  tree.add_child(tree.root(), 0);
  tree.node(tree.root()).visits = 1;
  tree.node(tree.root_node().children[0]).visits = 1;

  tree.advance_root(Move(5));

  EXPECT_EQ(tree.size(), 1u);
  EXPECT_EQ(tree.root_node().visits, 0u);
  EXPECT_EQ(tree.root_node().state, GameState(7, 6, 4, {5}));
  EXPECT_EQ(tree.root_node().state.current_player(), Player::B);
}

TEST(SearchTreeTest, AdvanceRootRejectsIllegalMoves) {
  SearchTree tree(GameState(7, 6, 4, {0, 0, 0, 0, 0, 0}));
  EXPECT_THROW(tree.advance_root(Move(-1)), InvalidMoveError);
  EXPECT_THROW(tree.advance_root(Move(7)), InvalidMoveError);
  EXPECT_THROW(tree.advance_root(Move(0)), InvalidMoveError);

  SearchTree finished(GameState(7, 6, 4, {0, 1, 0, 1, 0, 1, 0}));
  EXPECT_THROW(finished.advance_root(Move(3)), InvalidMoveError);
}

TEST(SearchTreeTest, InvariantCheckCatchesVisitDeficit) {
  SearchTree tree;
  NodeId c = tree.add_child(tree.root(), 0);
  tree.node(c).visits = 2;
  tree.node(tree.root()).visits = 1;
  EXPECT_THROW(tree.check_invariants(), SearchInvariantError);
}

TEST(SearchTreeTest, InvariantCheckCatchesLostMoves) {
  SearchTree tree;
  tree.node(tree.root()).untried_moves.pop_back();
  EXPECT_THROW(tree.check_invariants(), SearchInvariantError);
}

TEST(SearchTreeTest, ResetDropsEverything) {
  SearchTree tree;
  tree.add_child(tree.root(), 0);
  tree.add_child(tree.root(), 0);
  tree.reset(GameState(4, 4, 3));
  EXPECT_EQ(tree.size(), 1u);
  EXPECT_EQ(tree.depth(), 0);
  EXPECT_EQ(tree.root_node().untried_moves.size(), 4u);
}
