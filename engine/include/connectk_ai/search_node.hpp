#pragma once
#include "connectk/game_state.hpp"
#include "connectk/move.hpp"
#include <cstdint>
#include <limits>
#include <vector>

namespace connectk_ai {

// Index of a node inside SearchTree's arena.
using NodeId = uint32_t;
constexpr NodeId kNoNode = std::numeric_limits<NodeId>::max();

enum class NodeStatus : uint8_t {
  Unexpanded,         // no child created yet
  PartiallyExpanded,  // some moves tried
  FullyExpanded,      // every legal move has a child
};

/**
 * One vertex of the search tree.
 *
 * total_reward is accumulated from the point of view of the player who chose
 * move_from_parent, so a parent compares its children by their own mean.
 * parent is a plain index back into the arena and never owns anything.
 * terminal is fixed when the node is created.
 */
struct SearchNode {
  connectk::GameState state;
  connectk::Move move_from_parent;
  NodeId parent = kNoNode;

  uint64_t visits = 0;
  double total_reward = 0.0;

  std::vector<connectk::Move> untried_moves;  // ascending column order
  std::vector<NodeId> children;               // in expansion order
  bool terminal = false;

  SearchNode(const connectk::GameState& s, const connectk::Move& m, NodeId parent_id);

  double mean_reward() const { return visits == 0 ? 0.0 : total_reward / static_cast<double>(visits); }
  bool fully_expanded() const { return untried_moves.empty(); }
  NodeStatus status() const;
};

} // namespace connectk_ai
