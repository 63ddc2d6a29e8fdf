#include "connectk_ai/search_node.hpp"
#include "connectk/move_list.hpp"
#include "connectk/rules.hpp"
#include <utility>

namespace connectk_ai {

using namespace connectk;

SearchNode::SearchNode(const GameState& s, const Move& m, NodeId parent_id)
  : state(s), move_from_parent(m), parent(parent_id) {
  MoveList moves;
  Rules::legal_moves(state, moves);
  untried_moves = std::move(moves.moves);
  terminal = Rules::is_terminal(state);
}

NodeStatus SearchNode::status() const {
  if (children.empty() && !untried_moves.empty()) return NodeStatus::Unexpanded;
  if (!untried_moves.empty()) return NodeStatus::PartiallyExpanded;
  return NodeStatus::FullyExpanded;
}

} // namespace connectk_ai
