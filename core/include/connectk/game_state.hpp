#pragma once
#include "connectk/board.hpp"
#include "connectk/move.hpp"
#include "connectk/types.hpp"
#include <string>
#include <vector>

namespace connectk {

/**
 * Connect-K position: board, win length, side to move, last placement and
 * the column history that produced it.
 *
 * Copying a GameState is the way to branch a position; Rules::apply_move
 * returns a new value and leaves its argument untouched.
 */
class GameState {
public:
  // Standard 7x6 connect-four.
  GameState();
  // Throws ConfigurationError for width < 1, height < 1, connect_length < 1
  // or connect_length > max(width, height).
  GameState(int width, int height, int connect_length);
  // Replays `columns` from the empty board. Throws InvalidMoveError naming
  // the first column that cannot be played.
  GameState(int width, int height, int connect_length, const std::vector<int>& columns);

  void reset();

  const Board& board() const { return board_; }
  int width() const { return board_.width(); }
  int height() const { return board_.height(); }
  int connect_length() const { return connect_length_; }

  Player current_player() const { return to_move_; }
  // Player who placed the last token, i.e. the one who chose the move
  // leading into this position.
  Player previous_player() const { return opponent(to_move_); }

  bool has_last_move() const { return last_col_ >= 0; }
  int last_col() const { return last_col_; }
  int last_row() const { return last_row_; }
  Move last_move() const { return Move(last_col_); }

  const std::vector<Move>& history() const { return history_; }
  int filled_count() const { return board_.filled_count(); }

  // Drop the current player's token into m.col and pass the turn.
  // Throws InvalidMoveError if the column is out of range or full, or the
  // game is already over.
  void apply_move(const Move& m);

  // Take back the most recent token. Returns false if the board is empty.
  bool undo_move();

  // Same geometry and the history of `prefix` is a prefix of ours.
  bool extends(const GameState& prefix) const;

  // Grid with X for PlayerA, O for PlayerB and column numbers underneath.
  std::string to_string() const;

  bool operator==(const GameState& o) const {
    return connect_length_ == o.connect_length_ && to_move_ == o.to_move_ && board_ == o.board_;
  }
  bool operator!=(const GameState& o) const { return !(*this == o); }

private:
  Board board_;
  int connect_length_;
  Player to_move_ = Player::A;
  int last_col_ = -1;
  int last_row_ = -1;
  std::vector<Move> history_;
};

} // namespace connectk
