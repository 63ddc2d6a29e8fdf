#include "connectk_ai/random_policy.hpp"
#include "connectk/errors.hpp"
#include "connectk/rules.hpp"

namespace connectk_ai {

using namespace connectk;

std::mt19937 make_rng(uint64_t seed) {
  std::seed_seq seq{static_cast<uint32_t>(seed), static_cast<uint32_t>(seed >> 32)};
  return std::mt19937(seq);
}

Move RandomRollout::pick(const GameState& s, std::mt19937& rng) {
  Rules::legal_moves(s, moves_);
  if (moves_.empty()) {
    throw NoMovesAvailableError("no legal moves: the game is over");
  }
  std::uniform_int_distribution<size_t> dist(0, moves_.size() - 1);
  return moves_[dist(rng)];
}

GameResult RandomRollout::run(GameState state, std::mt19937& rng) {
  last_length_ = 0;
  for (;;) {
    Rules::legal_moves(state, moves_);
    if (moves_.empty()) break;
    std::uniform_int_distribution<size_t> dist(0, moves_.size() - 1);
    state.apply_move(moves_[dist(rng)]);
    ++last_length_;
  }
  return Rules::result(state);
}

RandomPolicy::RandomPolicy(uint64_t seed) : rng_(make_rng(seed)) {}

Move RandomPolicy::pick(const GameState& s) {
  return rollout_.pick(s, rng_);
}

} // namespace connectk_ai
