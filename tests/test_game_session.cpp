#include <gtest/gtest.h>
#include "game_session.hpp"
#include "connectk/rules.hpp"

using namespace connectk;
using namespace connectk_ai;
using connectk_play::Controller;
using connectk_play::GameSession;

namespace {

EngineConfig small_config() {
  EngineConfig config;
  config.budget = SearchBudget::iterations(200);
  config.search.seed = 7;
  return config;
}

} // namespace

TEST(GameSessionTest, ParsesColumnNumbers) {
  GameSession session(small_config(), Controller::Human, Controller::Human);
  std::string err;

  EXPECT_TRUE(session.apply_move_text("3", err));
  EXPECT_TRUE(session.apply_move_text("  4 \n", err));
  EXPECT_EQ(session.state.history().size(), 2u);
  EXPECT_EQ(session.state.board().at(3, 0), Player::A);
  EXPECT_EQ(session.state.board().at(4, 0), Player::B);
}

TEST(GameSessionTest, RejectsBadInput) {
  GameSession session(small_config(), Controller::Human, Controller::Human);
  std::string err;

  EXPECT_FALSE(session.apply_move_text("   ", err));
  EXPECT_EQ(err, "empty move");
  EXPECT_FALSE(session.apply_move_text("x", err));
  EXPECT_EQ(err, "expected a column number");
  EXPECT_FALSE(session.apply_move_text("-1", err));
  EXPECT_EQ(err, "expected a column number");

  err.clear();
  EXPECT_FALSE(session.apply_move_text("7", err));
  EXPECT_FALSE(err.empty());
  EXPECT_EQ(session.state.filled_count(), 0);
}

TEST(GameSessionTest, StatusText) {
  GameSession session(small_config(), Controller::Human, Controller::Human);
  std::string err;
  EXPECT_EQ(session.status_text(), "Ongoing, X to move");

  for (const char* col : {"0", "1", "0", "1", "0", "1"}) ASSERT_TRUE(session.apply_move_text(col, err));
  EXPECT_EQ(session.status_text(), "Ongoing, X to move");
  ASSERT_TRUE(session.apply_move_text("0", err));
  EXPECT_EQ(session.status_text(), "X wins");
  EXPECT_TRUE(session.is_over());

  EXPECT_FALSE(session.apply_move_text("2", err));
}

TEST(GameSessionTest, EngineAnswersHuman) {
  GameSession session(small_config(), Controller::Human, Controller::Engine);
  std::string err;

  EXPECT_FALSE(session.is_current_player_engine());
  ASSERT_TRUE(session.apply_move_text("3", err));
  ASSERT_TRUE(session.is_current_player_engine());

  Move m = session.play_engine_move();
  EXPECT_TRUE(m.is_valid());
  EXPECT_EQ(session.last_report.move, m);
  EXPECT_EQ(session.last_report.iterations, 200);
  EXPECT_EQ(session.state.history().size(), 2u);
  EXPECT_FALSE(session.is_current_player_engine());
}

TEST(GameSessionTest, UndoReturnsTheTurnToTheHuman) {
  GameSession session(small_config(), Controller::Human, Controller::Engine);
  std::string err;

  EXPECT_FALSE(session.undo());

  ASSERT_TRUE(session.apply_move_text("2", err));
  session.play_engine_move();
  ASSERT_TRUE(session.undo());

  EXPECT_TRUE(session.state.history().empty());
  EXPECT_EQ(session.state.current_player(), Player::A);
  EXPECT_EQ(session.state.filled_count(), 0);
}

TEST(GameSessionTest, UndoBetweenHumansTakesOnePly) {
  GameSession session(small_config(), Controller::Human, Controller::Human);
  std::string err;

  ASSERT_TRUE(session.apply_move_text("2", err));
  ASSERT_TRUE(session.apply_move_text("5", err));
  ASSERT_TRUE(session.undo());
  EXPECT_EQ(session.state.history().size(), 1u);
  EXPECT_EQ(session.state.current_player(), Player::B);
}

TEST(GameSessionTest, EngineSelfPlayEndsTheGame) {
  EngineConfig config = small_config();
  config.width = 4;
  config.height = 4;
  config.connect_length = 3;
  GameSession session(config, Controller::Engine, Controller::Engine);

  while (!session.is_over()) {
    ASSERT_TRUE(session.is_current_player_engine());
    session.play_engine_move();
  }
  EXPECT_EQ(session.status_text().find("Ongoing"), std::string::npos);

  session.reset();
  EXPECT_EQ(session.state.filled_count(), 0);
  EXPECT_EQ(session.last_report.iterations, 0);
}

TEST(GameSessionTest, RejectsNonAsciiInput) {
  GameSession session(small_config(), Controller::Human, Controller::Human);
  std::string err;

  EXPECT_FALSE(session.apply_move_text("\xe9", err));
  EXPECT_EQ(err, "expected a column number");
  EXPECT_FALSE(session.apply_move_text("3\xa0\xff", err));
  EXPECT_EQ(err, "expected a column number");
  EXPECT_EQ(session.state.filled_count(), 0);
}

TEST(GameSessionTest, ResetStartsAFreshSearch) {
  EngineConfig config = small_config();
  config.width = 4;
  config.height = 4;
  config.connect_length = 3;
  GameSession session(config, Controller::Engine, Controller::Engine);
  while (!session.is_over()) session.play_engine_move();

  session.reset();
  ASSERT_FALSE(session.is_over());
  session.play_engine_move();

  EXPECT_EQ(session.state.history().size(), 1u);
  EXPECT_EQ(session.last_report.root_visits, 200u);
  EXPECT_EQ(session.engine.searcher().tree().root_node().state, session.engine.new_game());
}
