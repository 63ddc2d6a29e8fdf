#pragma once
#include "connectk/types.hpp"
#include <vector>

namespace connectk {

// W columns of H cells. Row 0 is the bottom of a column; tokens stack upward.
class Board {
public:
  Board() : Board(7, 6) {}
  Board(int width, int height);

  int width() const { return width_; }
  int height() const { return height_; }

  bool in_bounds(int col, int row) const {
    return col >= 0 && col < width_ && row >= 0 && row < height_;
  }
  Player at(int col, int row) const { return cells_[row * width_ + col]; }

  int column_height(int col) const { return heights_[col]; }
  bool column_full(int col) const { return heights_[col] >= height_; }
  int filled_count() const { return filled_; }
  bool full() const { return filled_ == width_ * height_; }

  // Place a token on top of `col` and return the row it landed in.
  // The caller checks that the column is in range and not full.
  int drop(int col, Player p);
  // Remove the top token of `col`. The caller checks that it is not empty.
  void lift(int col);

  void clear();

  bool operator==(const Board& o) const {
    return width_ == o.width_ && height_ == o.height_ && cells_ == o.cells_;
  }
  bool operator!=(const Board& o) const { return !(*this == o); }

private:
  int width_;
  int height_;
  int filled_ = 0;
  std::vector<Player> cells_;  // row-major, row 0 at the bottom
  std::vector<int> heights_;   // tokens per column
};

} // namespace connectk
