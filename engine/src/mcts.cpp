#include "connectk_ai/mcts.hpp"
#include "connectk_ai/ucb.hpp"
#include "connectk/errors.hpp"
#include "connectk/rules.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>

using namespace connectk_ai;
using namespace connectk;

MCTS::MCTS(const SearchOptions& options)
  : options_(options), rng_(make_rng(options.seed)) {
}

void MCTS::reset(const GameState& s) {
  tree_.reset(s);
  has_tree_ = true;
}

void MCTS::advance(const Move& m) {
  if (!has_tree_) {
    throw InvalidMoveError("no search root to play column " + std::to_string(m.col) + " from");
  }
  tree_.advance_root(m);
}

/**
 * Reuse the current tree when `s` continues its root's game, otherwise
 * start a fresh one.
 */
void MCTS::prepare_root(const GameState& s) {
  if (!has_tree_ || !options_.reuse_tree || !s.extends(tree_.root_node().state)) {
    reset(s);
    return;
  }

  const auto& played = s.history();
  for (size_t i = tree_.root_node().state.history().size(); i < played.size(); ++i) {
    tree_.advance_root(played[i]);
  }
}

/**
 * Selection: descend by UCB1 until a node with an untried move or a
 * terminal node
 */
NodeId MCTS::selection(NodeId node) {
  for (;;) {
    const SearchNode& n = tree_.node(node);
    if (n.terminal || !n.untried_moves.empty()) {
      return node;
    }
    node = select_child(tree_, node, options_.exploration_constant, rng_);
  }
}

/**
 * Expansion: turn one untried move into a child
 */
NodeId MCTS::expansion(NodeId node) {
  const SearchNode& n = tree_.node(node);
  if (n.terminal) {
    return node;
  }

  size_t idx = 0;
  if (options_.expansion_order == ExpansionOrder::Random) {
    std::uniform_int_distribution<size_t> dist(0, n.untried_moves.size() - 1);
    idx = dist(rng_);
  }
  return tree_.add_child(node, idx);
}

/**
 * Simulation: uniform random playout to the end of the game
 */
GameResult MCTS::simulation(const GameState& state) {
  return rollout_.run(state, rng_);
}

double MCTS::reward_for(Player mover, const GameResult& outcome) const {
  if (outcome.is_draw()) return 0.0;
  return outcome.is_win_for(mover) ? 1.0 : options_.loss_reward;
}

/**
 * Backpropagation: walk parent indices up to the root. Each node is credited
 * from the side of the player who moved into it.
 */
void MCTS::backpropagation(NodeId node, const GameResult& outcome) {
  if (outcome.is_ongoing()) {
    throw SearchInvariantError("rollout ended on an undecided position");
  }
  while (node != kNoNode) {
    SearchNode& n = tree_.node(node);
    if (n.visits == std::numeric_limits<uint64_t>::max()) {
      throw SearchInvariantError("visit count overflow at node " + std::to_string(node));
    }
    n.visits++;
    n.total_reward += reward_for(n.state.previous_player(), outcome);
    node = n.parent;
  }
}

void MCTS::run_iteration() {
  // 1. Selection
  NodeId node = selection(tree_.root());

  // 2. Expansion
  node = expansion(node);

  // 3. Simulation
  GameResult outcome = simulation(tree_.node(node).state);

  // 4. Backpropagation
  backpropagation(node, outcome);
}

bool connectk_ai::prefer_final_child(const ChildStats& a, const ChildStats& b, FinalSelection rule) {
  if (rule == FinalSelection::RobustChild) {
    if (a.visits != b.visits) return a.visits > b.visits;
    if (a.mean_reward != b.mean_reward) return a.mean_reward > b.mean_reward;
  } else {
    if (a.mean_reward != b.mean_reward) return a.mean_reward > b.mean_reward;
    if (a.visits != b.visits) return a.visits > b.visits;
  }
  return a.move < b.move;
}

NodeId MCTS::pick_final_child() const {
  NodeId best = kNoNode;
  ChildStats best_stats;

  for (NodeId c : tree_.root_node().children) {
    const SearchNode& n = tree_.node(c);
    ChildStats stats{n.move_from_parent, n.visits, n.mean_reward()};
    if (best == kNoNode || prefer_final_child(stats, best_stats, options_.final_selection)) {
      best = c;
      best_stats = stats;
    }
  }

  if (best == kNoNode) {
    throw SearchInvariantError("search finished without expanding the root");
  }
  return best;
}

std::vector<ChildStats> MCTS::root_statistics() const {
  std::vector<ChildStats> stats;
  if (!has_tree_) return stats;

  const SearchNode& root = tree_.root_node();
  stats.reserve(root.children.size());
  for (NodeId c : root.children) {
    const SearchNode& child = tree_.node(c);
    stats.push_back(ChildStats{child.move_from_parent, child.visits, child.mean_reward()});
  }
  std::sort(stats.begin(), stats.end(),
            [](const ChildStats& a, const ChildStats& b) { return a.move < b.move; });
  return stats;
}

/**
 * Main search function
 */
Move MCTS::search(const GameState& s, const SearchBudget& budget) {
  if (Rules::is_terminal(s)) {
    throw NoMovesAvailableError("position is already decided: no move to search");
  }
  if (budget.amount < 1) {
    throw ConfigurationError("search budget must be positive");
  }

  auto start_time = std::chrono::steady_clock::now();
  prepare_root(s);

  int64_t iterations = 0;
  NodeId best = kNoNode;
  try {
    if (budget.is_time()) {
      const auto deadline = start_time + std::chrono::milliseconds(budget.amount);
      // The deadline is only looked at between iterations.
      do {
        run_iteration();
        ++iterations;
      } while (std::chrono::steady_clock::now() < deadline);
    } else {
      for (; iterations < budget.amount; ++iterations) {
        run_iteration();
      }
    }

    if (options_.verify_tree) {
      tree_.check_invariants();
    }
    best = pick_final_child();
  } catch (const SearchInvariantError&) {
    // The tree may be half updated; the next search starts from scratch.
    has_tree_ = false;
    throw;
  }

  auto end_time = std::chrono::steady_clock::now();

  report_ = SearchReport{};
  report_.move = tree_.node(best).move_from_parent;
  report_.iterations = iterations;
  report_.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
  report_.root_visits = tree_.root_node().visits;
  report_.tree_size = tree_.size();
  report_.tree_depth = tree_.depth();
  report_.children = root_statistics();

  if (options_.verbose) {
    log_search();
  }
  return report_.move;
}

Move MCTS::search(const GameState& s, int iterations) {
  return search(s, SearchBudget::iterations(iterations));
}

/**
 * Search with a thinking time
 */
Move MCTS::search_time(const GameState& s, int milliseconds) {
  return search(s, SearchBudget::time_millis(milliseconds));
}

void MCTS::log_search() const {
  double best_mean = 0.0;
  uint64_t best_visits = 0;
  for (const auto& c : report_.children) {
    if (c.move == report_.move) {
      best_mean = c.mean_reward;
      best_visits = c.visits;
    }
  }
  // Map the mean from [loss_reward, 1] onto a win percentage.
  const double span = 1.0 - options_.loss_reward;
  const double win_rate = span > 0.0 ? (best_mean - options_.loss_reward) / span * 100.0 : 0.0;

  std::ostringstream rate;
  rate << std::fixed << std::setprecision(1) << win_rate;

  std::cout << "[MCTS] Iterations: " << report_.iterations
            << " | Best move: " << report_.move.col
            << " | Best move visits: " << best_visits
            << " | Win rate: " << rate.str() << "%"
            << " | Tree: " << report_.tree_size << " nodes, depth " << report_.tree_depth
            << " | Time: " << report_.elapsed_ms << "ms\n";
}
