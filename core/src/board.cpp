#include "connectk/board.hpp"
#include <algorithm>

namespace connectk {

Board::Board(int width, int height)
  : width_(width), height_(height),
    cells_(static_cast<size_t>(width) * height, Player::None),
    heights_(width, 0) {
}

int Board::drop(int col, Player p) {
  int row = heights_[col]++;
  cells_[row * width_ + col] = p;
  ++filled_;
  return row;
}

void Board::lift(int col) {
  int row = --heights_[col];
  cells_[row * width_ + col] = Player::None;
  --filled_;
}

void Board::clear() {
  std::fill(cells_.begin(), cells_.end(), Player::None);
  std::fill(heights_.begin(), heights_.end(), 0);
  filled_ = 0;
}

} // namespace connectk
