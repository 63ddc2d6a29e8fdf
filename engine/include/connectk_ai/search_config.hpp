#pragma once
#include <cmath>
#include <cstdint>

namespace connectk_ai {

// Stopping rule for one search: a fixed number of iterations or a
// wall-clock allowance checked between iterations.
struct SearchBudget {
  enum class Kind : uint8_t { Iterations, TimeMillis };

  Kind kind = Kind::Iterations;
  int64_t amount = 2000;

  static SearchBudget iterations(int64_t n) { return SearchBudget{Kind::Iterations, n}; }
  static SearchBudget time_millis(int64_t ms) { return SearchBudget{Kind::TimeMillis, ms}; }

  bool is_time() const { return kind == Kind::TimeMillis; }
};

// Which untried move Expansion takes next.
enum class ExpansionOrder : uint8_t {
  Random,     // uniform over the untried moves
  Ascending,  // lowest column first
};

// How the move is chosen from the root children once the budget is spent.
enum class FinalSelection : uint8_t {
  RobustChild,  // most visits, then best mean reward, then lowest column
  MaxChild,     // best mean reward, then most visits, then lowest column
};

// Search policy knobs shared by MCTS and Engine.
struct SearchOptions {
  double exploration_constant = std::sqrt(2.0);
  uint64_t seed = 0;
  ExpansionOrder expansion_order = ExpansionOrder::Random;
  // Reward credited to the side that lost a rollout. Wins count 1, draws 0.
  double loss_reward = -1.0;
  FinalSelection final_selection = FinalSelection::RobustChild;
  // Carry the subtree of the played moves over to the next search.
  bool reuse_tree = true;
  // Run SearchTree::check_invariants after every search.
  bool verify_tree = false;
  bool verbose = false;
};

// Everything needed to build an Engine.
struct EngineConfig {
  int width = 7;
  int height = 6;
  int connect_length = 4;
  SearchBudget budget;
  SearchOptions search;

  // Throws connectk::ConfigurationError.
  void validate() const;
};

} // namespace connectk_ai
