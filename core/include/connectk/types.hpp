#pragma once
#include <cstdint>

namespace connectk {

// Cell occupant and side to move. None marks an empty cell.
enum class Player : uint8_t { None = 0, A = 1, B = 2 };

inline Player opponent(Player p) {
  if (p == Player::A) return Player::B;
  if (p == Player::B) return Player::A;
  return Player::None;
}

inline char player_symbol(Player p) {
  switch (p) {
    case Player::A: return 'X';
    case Player::B: return 'O';
    default: return '.';
  }
}

inline const char* player_name(Player p) {
  switch (p) {
    case Player::A: return "PlayerA";
    case Player::B: return "PlayerB";
    default: return "None";
  }
}

enum class GameStatus : uint8_t { Ongoing, Win, Draw };

// Outcome of a position: Ongoing, Win(winner) or Draw.
struct GameResult {
  GameStatus status = GameStatus::Ongoing;
  Player winner = Player::None;

  static GameResult ongoing() { return GameResult{}; }
  static GameResult win(Player p) { return GameResult{GameStatus::Win, p}; }
  static GameResult draw() { return GameResult{GameStatus::Draw, Player::None}; }

  bool is_ongoing() const { return status == GameStatus::Ongoing; }
  bool is_draw() const { return status == GameStatus::Draw; }
  bool is_win_for(Player p) const { return status == GameStatus::Win && winner == p; }

  bool operator==(const GameResult& o) const { return status == o.status && winner == o.winner; }
  bool operator!=(const GameResult& o) const { return !(*this == o); }
};

} // namespace connectk
