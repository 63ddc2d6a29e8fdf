#pragma once
#include "connectk/game_state.hpp"
#include "connectk/move.hpp"
#include "connectk/move_list.hpp"
#include "connectk/types.hpp"
#include <cstdint>
#include <random>

namespace connectk_ai {

// Uniformly random playout used by the Simulation phase. All randomness
// comes from the generator passed in.
class RandomRollout {
public:
  // Uniform legal move. Throws NoMovesAvailableError on a finished game.
  connectk::Move pick(const connectk::GameState& s, std::mt19937& rng);

  // Play `state` out to the end and report the outcome.
  connectk::GameResult run(connectk::GameState state, std::mt19937& rng);

  // Plies played by the last run().
  int last_length() const { return last_length_; }

private:
  connectk::MoveList moves_;
  int last_length_ = 0;
};

// Player that moves uniformly at random, with its own generator.
class RandomPolicy {
public:
  explicit RandomPolicy(uint64_t seed = 0);
  connectk::Move pick(const connectk::GameState& s);

private:
  std::mt19937 rng_;
  RandomRollout rollout_;
};

// Seed an mt19937 from all 64 bits of `seed`.
std::mt19937 make_rng(uint64_t seed);

} // namespace connectk_ai
