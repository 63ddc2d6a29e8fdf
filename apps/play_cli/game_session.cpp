#include "game_session.hpp"
#include "connectk/errors.hpp"
#include "connectk/rules.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace connectk_play {

using namespace connectk;

GameSession::GameSession(const connectk_ai::EngineConfig& config, Controller a, Controller b)
  : engine(config), state(engine.new_game()), player_a(a), player_b(b) {
}

bool GameSession::apply_move(const Move& move, std::string& err_msg) {
  try {
    state = engine.apply_move(state, move);
  } catch (const InvalidMoveError& e) {
    err_msg = e.what();
    return false;
  }
  return true;
}

Move GameSession::play_engine_move() {
  Move m = engine.best_move(state, last_report);
  state = engine.apply_move(state, m);
  return m;
}

bool GameSession::is_current_player_engine() const {
  Controller c = (state.current_player() == Player::A) ? player_a : player_b;
  return c == Controller::Engine;
}

bool GameSession::is_over() const {
  return Rules::is_terminal(state);
}

bool GameSession::undo() {
  if (!state.undo_move()) {
    return false;
  }
  while (is_current_player_engine() && !state.history().empty()) {
    state.undo_move();
  }
  return true;
}

void GameSession::reset() {
  state = engine.new_game();
  last_report = connectk_ai::SearchReport{};
}

std::string GameSession::status_text() const {
  std::ostringstream oss;
  GameResult r = Rules::result(state);
  if (r.is_draw()) {
    oss << "Draw";
  } else if (!r.is_ongoing()) {
    oss << player_symbol(r.winner) << " wins";
  } else {
    oss << "Ongoing, " << player_symbol(state.current_player()) << " to move";
  }
  return oss.str();
}

bool GameSession::apply_move_text(const std::string& move_str, std::string& err_msg) {
  // Trim
  auto s = move_str;
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch){ return !std::isspace(ch); }));
  s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch){ return !std::isspace(ch); }).base(), s.end());
  if (s.empty()) { err_msg = "empty move"; return false; }

  if (!std::all_of(s.begin(), s.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; }) || s.size() > 6) {
    err_msg = "expected a column number";
    return false;
  }
  return apply_move(Move(std::stoi(s)), err_msg);
}

} // namespace connectk_play
