#pragma once
#include "connectk/move.hpp"
#include <cstddef>
#include <vector>

namespace connectk {

// Reusable list of moves. Rules::legal_moves fills it without reallocating
// once the capacity reaches the board width.
struct MoveList {
  std::vector<Move> moves;

  void clear() { moves.clear(); }
  void push_back(const Move& m) { moves.push_back(m); }
  bool empty() const { return moves.empty(); }
  size_t size() const { return moves.size(); }
  bool contains(const Move& m) const {
    for (const auto& x : moves) if (x == m) return true;
    return false;
  }

  Move& operator[](size_t i) { return moves[i]; }
  const Move& operator[](size_t i) const { return moves[i]; }

  std::vector<Move>::iterator begin() { return moves.begin(); }
  std::vector<Move>::iterator end() { return moves.end(); }
  std::vector<Move>::const_iterator begin() const { return moves.begin(); }
  std::vector<Move>::const_iterator end() const { return moves.end(); }
};

} // namespace connectk
