#pragma once
#include "connectk/game_state.hpp"
#include "connectk/move_list.hpp"
#include "connectk/types.hpp"
#include <optional>

namespace connectk {

struct Rules {
  // One move per non-full column in ascending order; empty once the game is over.
  static void legal_moves(const GameState& s, MoveList& out);
  static bool is_legal(const GameState& s, const Move& m);

  // Successor of `s` after `m`. Throws InvalidMoveError.
  static GameState apply_move(const GameState& s, const Move& m);

  // Checks only the four lines through the last placed token, at most K-1
  // cells each way.
  static std::optional<Player> winner(const GameState& s);
  static bool is_draw(const GameState& s);
  static bool is_terminal(const GameState& s);
  static GameResult result(const GameState& s);

private:
  // Consecutive tokens of `p` starting one step away from (col,row) along
  // (dc,dr), capped at `limit`.
  static int run_length(const Board& b, int col, int row, int dc, int dr, Player p, int limit);
};

} // namespace connectk
