#include "connectk_ai/ucb.hpp"
#include <cmath>
#include <limits>
#include <string>
#include <vector>

namespace connectk_ai {

double ucb1_score(double total_reward, uint64_t visits, uint64_t parent_visits,
                  double exploration_constant) {
  if (visits == 0) {
    return std::numeric_limits<double>::infinity();
  }
  const double n = static_cast<double>(visits);
  double exploitation = total_reward / n;
  double exploration = exploration_constant * std::sqrt(std::log(static_cast<double>(parent_visits)) / n);
  return exploitation + exploration;
}

NodeId select_child(const SearchTree& tree, NodeId parent, double exploration_constant,
                    std::mt19937& rng) {
  const SearchNode& p = tree.node(parent);
  if (p.children.empty()) {
    throw SearchInvariantError("selection reached node " + std::to_string(parent) + " without children");
  }

  std::vector<NodeId> best;
  double best_score = -std::numeric_limits<double>::infinity();

  for (NodeId c : p.children) {
    const SearchNode& child = tree.node(c);
    double score = ucb1_score(child.total_reward, child.visits, p.visits, exploration_constant);
    if (score > best_score) {
      best_score = score;
      best.clear();
      best.push_back(c);
    } else if (score == best_score) {
      best.push_back(c);
    }
  }

  if (best.empty()) {
    // Only NaN scores, which needs a NaN reward or exploration constant.
    throw SearchInvariantError("no finite UCB1 score under node " + std::to_string(parent));
  }
  if (best.size() == 1) {
    return best.front();
  }
  std::uniform_int_distribution<size_t> dist(0, best.size() - 1);
  return best[dist(rng)];
}

} // namespace connectk_ai
