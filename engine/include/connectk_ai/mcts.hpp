#pragma once
#include "connectk/game_state.hpp"
#include "connectk/move.hpp"
#include "connectk/types.hpp"
#include "connectk_ai/random_policy.hpp"
#include "connectk_ai/search_config.hpp"
#include "connectk_ai/search_tree.hpp"
#include <cstdint>
#include <random>
#include <vector>

namespace connectk_ai {

struct ChildStats {
  connectk::Move move;
  uint64_t visits = 0;
  double mean_reward = 0.0;
};

// What the last search did, for display and tests.
struct SearchReport {
  connectk::Move move;
  int64_t iterations = 0;
  int64_t elapsed_ms = 0;
  uint64_t root_visits = 0;
  size_t tree_size = 0;
  int tree_depth = 0;
  std::vector<ChildStats> children;  // ascending column order
};

// Final move ordering: true if `a` is played rather than `b`.
// RobustChild compares visits, then mean reward; MaxChild compares mean
// reward, then visits. Remaining ties go to the lower column.
bool prefer_final_child(const ChildStats& a, const ChildStats& b, FinalSelection rule);

/**
 * Monte Carlo Tree Search over connect-K positions.
 *
 * One iteration is selection (UCB1 descent), expansion (at most one new
 * node), simulation (uniform random playout) and backpropagation (leaf to
 * root along parent indices). The tree survives between searches: when the
 * next position extends the root's move history, the root is advanced along
 * the played moves and its statistics are kept.
 *
 * All randomness comes from one generator seeded from SearchOptions::seed.
 */
class MCTS {
public:
  explicit MCTS(const SearchOptions& options = SearchOptions());

  // Search `s` until the budget runs out and return the chosen move.
  // Throws NoMovesAvailableError if `s` is already decided. After a
  // SearchInvariantError the tree is dropped.
  connectk::Move search(const connectk::GameState& s, const SearchBudget& budget);
  connectk::Move search(const connectk::GameState& s, int iterations = 1000);
  connectk::Move search_time(const connectk::GameState& s, int milliseconds);

  // Commit a real move at the current root.
  void advance(const connectk::Move& m);
  // Drop the tree and start from `s`.
  void reset(const connectk::GameState& s);

  const SearchTree& tree() const { return tree_; }
  const SearchReport& last_report() const { return report_; }
  // Visits and mean reward of every root child.
  std::vector<ChildStats> root_statistics() const;

  const SearchOptions& options() const { return options_; }
  void set_exploration_constant(double c) { options_.exploration_constant = c; }
  void set_verbose(bool v) { options_.verbose = v; }

private:
  SearchOptions options_;
  std::mt19937 rng_;
  SearchTree tree_;
  bool has_tree_ = false;
  RandomRollout rollout_;
  SearchReport report_;

  void prepare_root(const connectk::GameState& s);
  void run_iteration();

  NodeId selection(NodeId node);
  NodeId expansion(NodeId node);
  connectk::GameResult simulation(const connectk::GameState& state);
  void backpropagation(NodeId node, const connectk::GameResult& outcome);

  double reward_for(connectk::Player mover, const connectk::GameResult& outcome) const;
  NodeId pick_final_child() const;
  void log_search() const;
};

} // namespace connectk_ai
