#pragma once
#include "connectk_ai/search_tree.hpp"
#include <cstdint>
#include <random>

namespace connectk_ai {

// UCB1: mean + c * sqrt(ln(parent_visits) / visits). Infinite while the
// child has no visits.
double ucb1_score(double total_reward, uint64_t visits, uint64_t parent_visits,
                  double exploration_constant);

// Child of `parent` with the highest UCB1 score. Equal scores are broken
// uniformly at random with `rng`. `parent` must have at least one child.
NodeId select_child(const SearchTree& tree, NodeId parent, double exploration_constant,
                    std::mt19937& rng);

} // namespace connectk_ai
