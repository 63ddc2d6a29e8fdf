#pragma once
#include "connectk/game_state.hpp"
#include "connectk/move.hpp"
#include "connectk_ai/engine.hpp"
#include "connectk_ai/search_config.hpp"
#include <string>

namespace connectk_play {

enum class Controller {
  Human,
  Engine,
};

struct GameSession {
  connectk_ai::Engine engine;
  connectk::GameState state;
  Controller player_a;
  Controller player_b;
  connectk_ai::SearchReport last_report;

  GameSession(const connectk_ai::EngineConfig& config, Controller a, Controller b);

  // Apply a move and return true if successful
  bool apply_move(const connectk::Move& move, std::string& err_msg);

  // Ask the engine for the current player's move and play it
  connectk::Move play_engine_move();

  bool is_current_player_engine() const;
  bool is_over() const;

  // Take back moves until a human is to move again (at least one ply).
  // Returns false if there was nothing to take back.
  bool undo();

  void reset();

  std::string board_text() const { return state.to_string(); }

  // "Ongoing, X to move", "X wins", "Draw"
  std::string status_text() const;

  // Parse a column number ("3", " 3 ") and apply it.
  // Returns false on parse/validation error (err_msg filled).
  bool apply_move_text(const std::string& move_str, std::string& err_msg);
};

} // namespace connectk_play
