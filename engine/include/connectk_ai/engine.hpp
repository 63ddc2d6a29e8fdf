#pragma once
#include "connectk/game_state.hpp"
#include "connectk/move.hpp"
#include "connectk/types.hpp"
#include "connectk_ai/mcts.hpp"
#include "connectk_ai/search_config.hpp"
#include <cstdint>

namespace connectk_ai {

/**
 * Entry point for front ends: a validated configuration plus one MCTS
 * instance whose tree follows the game from call to call.
 *
 * Usage:
 *   Engine engine = Engine::configure(7, 6, 4, std::sqrt(2.0),
 *                                     SearchBudget::iterations(2000), 42);
 *   GameState s = engine.new_game();
 *   s = engine.apply_move(s, engine.best_move(s));
 */
class Engine {
public:
  // Throws connectk::ConfigurationError.
  explicit Engine(const EngineConfig& config);

  static Engine configure(int width, int height, int connect_length,
                          double exploration_constant, SearchBudget budget, uint64_t seed);

  // Empty board of the configured size, PlayerA to move.
  connectk::GameState new_game() const;

  // Run the whole budget on `s` and return the chosen column.
  // Throws NoMovesAvailableError on a decided position and
  // ConfigurationError when `s` has a different geometry.
  connectk::Move best_move(const connectk::GameState& s);
  // Same, and copy the per-child statistics into `report`.
  connectk::Move best_move(const connectk::GameState& s, SearchReport& report);

  // Throws InvalidMoveError.
  connectk::GameState apply_move(const connectk::GameState& s, const connectk::Move& m) const;

  static connectk::GameResult result(const connectk::GameState& s);

  const EngineConfig& config() const { return config_; }
  const MCTS& searcher() const { return mcts_; }
  void set_verbose(bool v) { config_.search.verbose = v; mcts_.set_verbose(v); }

private:
  EngineConfig config_;
  MCTS mcts_;

  void check_geometry(const connectk::GameState& s) const;
};

} // namespace connectk_ai
