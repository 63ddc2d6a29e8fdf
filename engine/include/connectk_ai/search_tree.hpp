#pragma once
#include "connectk/game_state.hpp"
#include "connectk/move.hpp"
#include "connectk_ai/search_node.hpp"
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace connectk_ai {

// Broken tree bookkeeping. Aborts the running search.
class SearchInvariantError : public std::logic_error {
public:
  explicit SearchInvariantError(const std::string& what) : std::logic_error(what) {}
};

/**
 * Arena of SearchNodes for one game.
 *
 * Nodes live in a single vector and refer to each other by NodeId. The tree
 * owns every node; advance_root keeps the subtree under the played move,
 * drops everything else and compacts the arena so the new root is index 0.
 * Adding a node may reallocate the arena, so references returned by node()
 * are only valid until the next add_child or advance_root.
 */
class SearchTree {
public:
  SearchTree();
  explicit SearchTree(const connectk::GameState& root_state);

  // Discard every node and start over from `root_state`.
  void reset(const connectk::GameState& root_state);

  NodeId root() const { return root_; }
  const SearchNode& root_node() const { return nodes_[root_]; }
  const SearchNode& node(NodeId id) const { return nodes_[id]; }
  SearchNode& node(NodeId id) { return nodes_[id]; }

  // Child of `parent` reached by `m`, or kNoNode if it was never expanded.
  NodeId find_child(NodeId parent, const connectk::Move& m) const;

  // Expand untried move `untried_index` of `parent` into a fresh child.
  NodeId add_child(NodeId parent, size_t untried_index);

  // Commit a real move. The child for `m` (created if needed) becomes the
  // root with its statistics intact; all siblings are freed.
  // Throws InvalidMoveError if `m` is not legal at the root.
  void advance_root(const connectk::Move& m);

  // Nodes currently held.
  size_t size() const { return nodes_.size(); }
  // Longest root-to-leaf path in edges.
  int depth() const;

  // Throws SearchInvariantError on the first broken invariant found.
  void check_invariants() const;

private:
  std::vector<SearchNode> nodes_;
  NodeId root_ = 0;

  void compact_from(NodeId new_root);
};

} // namespace connectk_ai
