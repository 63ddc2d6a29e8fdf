#pragma once

namespace connectk {

// A move drops the current player's token into column `col`.
struct Move {
  int col = -1;

  Move() = default;
  explicit Move(int c) : col(c) {}

  bool is_valid() const { return col >= 0; }

  bool operator==(const Move& o) const { return col == o.col; }
  bool operator!=(const Move& o) const { return col != o.col; }
  bool operator<(const Move& o) const { return col < o.col; }
};

} // namespace connectk
