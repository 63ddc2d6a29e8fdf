#include "connectk/rules.hpp"
#include "connectk/game_state.hpp"

namespace connectk {

namespace {

constexpr int kDirections[4][2] = {
  {1, 0},   // horizontal
  {0, 1},   // vertical
  {1, 1},   // rising diagonal
  {1, -1},  // falling diagonal
};

} // namespace

void Rules::legal_moves(const GameState& s, MoveList& out) {
  out.clear();
  if (is_terminal(s)) return;

  const Board& b = s.board();
  for (int col = 0; col < b.width(); ++col) {
    if (!b.column_full(col)) out.push_back(Move(col));
  }
}

bool Rules::is_legal(const GameState& s, const Move& m) {
  const Board& b = s.board();
  if (m.col < 0 || m.col >= b.width() || b.column_full(m.col)) return false;
  return !winner(s).has_value();
}

GameState Rules::apply_move(const GameState& s, const Move& m) {
  GameState next = s;
  next.apply_move(m);
  return next;
}

int Rules::run_length(const Board& b, int col, int row, int dc, int dr, Player p, int limit) {
  int n = 0;
  col += dc;
  row += dr;
  while (n < limit && b.in_bounds(col, row) && b.at(col, row) == p) {
    ++n;
    col += dc;
    row += dr;
  }
  return n;
}

std::optional<Player> Rules::winner(const GameState& s) {
  if (!s.has_last_move()) return std::nullopt;

  const Board& b = s.board();
  const int col = s.last_col();
  const int row = s.last_row();
  const Player p = b.at(col, row);
  const int k = s.connect_length();

  for (const auto& d : kDirections) {
    int count = 1 + run_length(b, col, row, d[0], d[1], p, k - 1);
    if (count >= k) return p;
    count += run_length(b, col, row, -d[0], -d[1], p, k - 1);
    if (count >= k) return p;
  }
  return std::nullopt;
}

bool Rules::is_draw(const GameState& s) {
  return s.board().full() && !winner(s).has_value();
}

bool Rules::is_terminal(const GameState& s) {
  return winner(s).has_value() || s.board().full();
}

GameResult Rules::result(const GameState& s) {
  if (auto w = winner(s)) return GameResult::win(*w);
  if (s.board().full()) return GameResult::draw();
  return GameResult::ongoing();
}

} // namespace connectk
