#include "connectk/game_state.hpp"
#include "connectk/errors.hpp"
#include "connectk/rules.hpp"
#include <algorithm>
#include <sstream>

namespace connectk {

namespace {

Board make_board(int width, int height, int connect_length) {
  if (width < 1 || height < 1) {
    throw ConfigurationError("board must be at least 1x1, got " +
                             std::to_string(width) + "x" + std::to_string(height));
  }
  if (connect_length < 1 || connect_length > std::max(width, height)) {
    throw ConfigurationError("connect length " + std::to_string(connect_length) +
                             " does not fit a " + std::to_string(width) + "x" +
                             std::to_string(height) + " board");
  }
  return Board(width, height);
}

} // namespace

GameState::GameState() : GameState(7, 6, 4) {}

GameState::GameState(int width, int height, int connect_length)
  : board_(make_board(width, height, connect_length)), connect_length_(connect_length) {
}

GameState::GameState(int width, int height, int connect_length, const std::vector<int>& columns)
  : GameState(width, height, connect_length) {
  history_.reserve(columns.size());
  for (size_t i = 0; i < columns.size(); ++i) {
    try {
      apply_move(Move(columns[i]));
    } catch (const InvalidMoveError& e) {
      throw InvalidMoveError("invalid move sequence at index " + std::to_string(i) + ": " + e.what());
    }
  }
}

void GameState::reset() {
  board_.clear();
  to_move_ = Player::A;
  last_col_ = -1;
  last_row_ = -1;
  history_.clear();
}

void GameState::apply_move(const Move& m) {
  if (m.col < 0 || m.col >= board_.width()) {
    throw InvalidMoveError("column " + std::to_string(m.col) + " is out of range [0, " +
                           std::to_string(board_.width()) + ")");
  }
  if (board_.column_full(m.col)) {
    throw InvalidMoveError("column " + std::to_string(m.col) + " is full");
  }
  if (Rules::winner(*this).has_value()) {
    throw InvalidMoveError("game is already over");
  }

  last_row_ = board_.drop(m.col, to_move_);
  last_col_ = m.col;
  history_.push_back(m);
  to_move_ = opponent(to_move_);
}

bool GameState::undo_move() {
  if (history_.empty()) {
    return false;
  }
  board_.lift(history_.back().col);
  history_.pop_back();
  to_move_ = opponent(to_move_);

  if (history_.empty()) {
    last_col_ = -1;
    last_row_ = -1;
  } else {
    last_col_ = history_.back().col;
    last_row_ = board_.column_height(last_col_) - 1;
  }
  return true;
}

bool GameState::extends(const GameState& prefix) const {
  if (width() != prefix.width() || height() != prefix.height() ||
      connect_length_ != prefix.connect_length_) {
    return false;
  }
  if (prefix.history_.size() > history_.size()) {
    return false;
  }
  return std::equal(prefix.history_.begin(), prefix.history_.end(), history_.begin());
}

std::string GameState::to_string() const {
  std::ostringstream oss;
  const int w = board_.width();
  const std::string rule(4 * w + 1, '-');

  oss << rule << "\n";
  for (int row = board_.height() - 1; row >= 0; --row) {
    for (int col = 0; col < w; ++col) {
      Player p = board_.at(col, row);
      oss << "| " << (p == Player::None ? ' ' : player_symbol(p)) << " ";
    }
    oss << "|\n";
  }
  oss << rule << "\n";
  for (int col = 0; col < w; ++col) {
    // Each cell is four characters wide; labels end one short of the next bar.
    std::string label = std::to_string(col);
    oss << std::string(label.size() < 3 ? 3 - label.size() : 0, ' ') << label << " ";
  }
  oss << "\n";
  return oss.str();
}

} // namespace connectk
