#include "connectk_ai/search_tree.hpp"
#include "connectk/errors.hpp"
#include "connectk/move_list.hpp"
#include "connectk/rules.hpp"
#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>

namespace connectk_ai {

using namespace connectk;

SearchTree::SearchTree() : SearchTree(GameState()) {}

SearchTree::SearchTree(const GameState& root_state) {
  reset(root_state);
}

void SearchTree::reset(const GameState& root_state) {
  nodes_.clear();
  nodes_.emplace_back(root_state, Move(), kNoNode);
  root_ = 0;
}

NodeId SearchTree::find_child(NodeId parent, const Move& m) const {
  for (NodeId c : nodes_[parent].children) {
    if (nodes_[c].move_from_parent == m) return c;
  }
  return kNoNode;
}

NodeId SearchTree::add_child(NodeId parent, size_t untried_index) {
  if (untried_index >= nodes_[parent].untried_moves.size()) {
    throw SearchInvariantError("node " + std::to_string(parent) + " has no untried move #" +
                               std::to_string(untried_index));
  }
  if (nodes_.size() >= static_cast<size_t>(kNoNode)) {
    throw SearchInvariantError("search tree is out of node ids");
  }

  auto& untried = nodes_[parent].untried_moves;
  const Move m = untried[untried_index];
  untried.erase(untried.begin() + static_cast<std::ptrdiff_t>(untried_index));

  // Build the child before touching the arena; emplace_back may reallocate.
  SearchNode child(Rules::apply_move(nodes_[parent].state, m), m, parent);
  const NodeId id = static_cast<NodeId>(nodes_.size());
  nodes_.push_back(std::move(child));
  nodes_[parent].children.push_back(id);
  return id;
}

void SearchTree::advance_root(const Move& m) {
  const SearchNode& r = nodes_[root_];
  if (!Rules::is_legal(r.state, m)) {
    throw InvalidMoveError("column " + std::to_string(m.col) + " is not a legal move at the search root");
  }

  NodeId child = find_child(root_, m);
  if (child == kNoNode) {
    const auto& untried = nodes_[root_].untried_moves;
    auto it = std::find(untried.begin(), untried.end(), m);
    if (it == untried.end()) {
      throw SearchInvariantError("legal move " + std::to_string(m.col) +
                                 " is neither expanded nor untried at the root");
    }
    child = add_child(root_, static_cast<size_t>(it - untried.begin()));
  }
  compact_from(child);
}

void SearchTree::compact_from(NodeId new_root) {
  // Breadth-first renumbering of the kept subtree.
  std::vector<NodeId> remap(nodes_.size(), kNoNode);
  std::vector<NodeId> order;
  order.push_back(new_root);
  remap[new_root] = 0;
  for (size_t i = 0; i < order.size(); ++i) {
    for (NodeId c : nodes_[order[i]].children) {
      remap[c] = static_cast<NodeId>(order.size());
      order.push_back(c);
    }
  }

  std::vector<SearchNode> kept;
  kept.reserve(order.size());
  for (NodeId old : order) {
    SearchNode n = std::move(nodes_[old]);
    n.parent = (old == new_root) ? kNoNode : remap[n.parent];
    for (auto& c : n.children) c = remap[c];
    kept.push_back(std::move(n));
  }

  nodes_.swap(kept);
  root_ = 0;
}

int SearchTree::depth() const {
  int deepest = 0;
  std::vector<std::pair<NodeId, int>> stack;
  stack.emplace_back(root_, 0);
  while (!stack.empty()) {
    auto [id, d] = stack.back();
    stack.pop_back();
    deepest = std::max(deepest, d);
    for (NodeId c : nodes_[id].children) stack.emplace_back(c, d + 1);
  }
  return deepest;
}

void SearchTree::check_invariants() const {
  MoveList legal;
  std::vector<Move> seen;
  std::vector<NodeId> stack{root_};

  while (!stack.empty()) {
    const NodeId id = stack.back();
    stack.pop_back();
    const SearchNode& n = nodes_[id];
    const std::string where = "node " + std::to_string(id) + ": ";

    if (n.terminal != Rules::is_terminal(n.state)) {
      throw SearchInvariantError(where + "terminal flag does not match its state");
    }
    if (n.terminal && (!n.untried_moves.empty() || !n.children.empty())) {
      throw SearchInvariantError(where + "terminal node has moves or children");
    }

    seen.assign(n.untried_moves.begin(), n.untried_moves.end());
    uint64_t child_visits = 0;
    for (NodeId c : n.children) {
      if (c >= nodes_.size()) {
        throw SearchInvariantError(where + "child index " + std::to_string(c) + " out of range");
      }
      const SearchNode& child = nodes_[c];
      if (child.parent != id) {
        throw SearchInvariantError(where + "child " + std::to_string(c) + " points at another parent");
      }
      seen.push_back(child.move_from_parent);
      child_visits += child.visits;
      stack.push_back(c);
    }

    Rules::legal_moves(n.state, legal);
    std::sort(seen.begin(), seen.end());
    if (seen.size() != legal.size() || !std::equal(seen.begin(), seen.end(), legal.begin())) {
      throw SearchInvariantError(where + "untried moves and children do not cover the legal moves");
    }
    if (n.visits < child_visits) {
      throw SearchInvariantError(where + "visits " + std::to_string(n.visits) +
                                 " below children total " + std::to_string(child_visits));
    }
  }
}

} // namespace connectk_ai
