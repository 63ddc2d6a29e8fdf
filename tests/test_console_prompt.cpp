#include <gtest/gtest.h>
#include "console_prompt.hpp"
#include <sstream>
#include <string>

using namespace connectk_ai;
using namespace connectk_play;

TEST(ConsolePromptTest, ParseIntTakesWholeLinesOnly) {
  int v = 0;
  EXPECT_TRUE(parse_int("12", v));
  EXPECT_EQ(v, 12);
  EXPECT_TRUE(parse_int("  -3 \r", v));
  EXPECT_EQ(v, -3);

  v = 99;
  EXPECT_FALSE(parse_int("7abc", v));
  EXPECT_FALSE(parse_int("4 4", v));
  EXPECT_FALSE(parse_int("", v));
  EXPECT_FALSE(parse_int("six", v));
  EXPECT_FALSE(parse_int("99999999999", v));
  EXPECT_EQ(v, 99);
}

TEST(ConsolePromptTest, PromptIntAsksAgainAfterJunk) {
  std::istringstream in("x\n7abc\n5\n");
  std::ostringstream out;
  int v = 1;

  ASSERT_TRUE(prompt_int(in, out, "Width? ", v));
  EXPECT_EQ(v, 5);

  const std::string log = out.str();
  size_t first = log.find("Invalid input");
  ASSERT_NE(first, std::string::npos);
  EXPECT_NE(log.find("Invalid input", first + 1), std::string::npos);
}

TEST(ConsolePromptTest, PromptIntKeepsValueOnEmptyLine) {
  std::istringstream in("\n");
  std::ostringstream out;
  int v = 6;
  ASSERT_TRUE(prompt_int(in, out, "Height? ", v));
  EXPECT_EQ(v, 6);
  EXPECT_NE(out.str().find("Height? [6]"), std::string::npos);
}

TEST(ConsolePromptTest, PromptIntStopsAtEndOfInput) {
  std::istringstream in("abc\n");
  std::ostringstream out;
  int v = 0;
  EXPECT_FALSE(prompt_int(in, out, "Height? ", v));
}

TEST(ConsolePromptTest, PromptYes) {
  std::istringstream in(" yes\nNo\n");
  std::ostringstream out;
  bool answer = false;
  ASSERT_TRUE(prompt_yes(in, out, "Go first? ", answer));
  EXPECT_TRUE(answer);
  ASSERT_TRUE(prompt_yes(in, out, "Go first? ", answer));
  EXPECT_FALSE(answer);
  EXPECT_FALSE(prompt_yes(in, out, "Go first? ", answer));
}

// Order of questions: height, width, K, iterations.
TEST(ConsolePromptTest, ZeroHeightIsAskedAgain) {
  std::istringstream in("0\n7\n4\n100\n6\n7\n4\n100\n");
  std::ostringstream out;
  EngineConfig config;

  ASSERT_TRUE(prompt_config(in, out, config, SetupQuestions{}));
  EXPECT_NE(out.str().find("board must be at least 1x1"), std::string::npos);
  EXPECT_EQ(config.height, 6);
  EXPECT_EQ(config.width, 7);
  EXPECT_EQ(config.connect_length, 4);
  EXPECT_EQ(config.budget.amount, 100);
  EXPECT_FALSE(config.budget.is_time());
}

TEST(ConsolePromptTest, ConnectLengthMustFitTheBoard) {
  std::istringstream in("2\n2\n\n\n3\n3\n3\n\n");
  std::ostringstream out;
  EngineConfig config;

  ASSERT_TRUE(prompt_config(in, out, config, SetupQuestions{}));
  EXPECT_NE(out.str().find("connect length 4 does not fit a 2x2 board"), std::string::npos);
  EXPECT_EQ(config.width, 3);
  EXPECT_EQ(config.height, 3);
  EXPECT_EQ(config.connect_length, 3);
  EXPECT_EQ(config.budget.amount, 2000);
}

TEST(ConsolePromptTest, ZeroIterationsIsAskedAgain) {
  std::istringstream in("6\n7\n4\n0\n\n\n\n250\n");
  std::ostringstream out;
  EngineConfig config;

  ASSERT_TRUE(prompt_config(in, out, config, SetupQuestions{}));
  EXPECT_NE(out.str().find("search budget must be positive"), std::string::npos);
  EXPECT_EQ(config.budget.amount, 250);
}

TEST(ConsolePromptTest, SettingsFromFlagsAreNotAsked) {
  std::istringstream in("");
  std::ostringstream out;
  EngineConfig config;
  config.width = 9;
  config.height = 7;
  config.connect_length = 5;
  config.budget = SearchBudget::time_millis(500);

  SetupQuestions ask;
  ask.board_size = false;
  ask.connect_length = false;
  ask.iterations = false;
  ASSERT_TRUE(prompt_config(in, out, config, ask));
  EXPECT_TRUE(out.str().empty());
  EXPECT_TRUE(config.budget.is_time());
}

TEST(ConsolePromptTest, BadFlagsLeadToQuestions) {
  std::ostringstream out;
  EngineConfig config;
  config.connect_length = 9;

  SetupQuestions ask;
  ask.board_size = false;
  ask.connect_length = false;
  ask.iterations = false;
  std::istringstream fix("\n\n4\n\n");
  ASSERT_TRUE(prompt_config(fix, out, config, ask));
  EXPECT_NE(out.str().find("How many in a row to win?"), std::string::npos);
  EXPECT_EQ(config.connect_length, 4);
}

TEST(ConsolePromptTest, EndOfInputDuringSetup) {
  std::istringstream in("0\n7\n4\n100\n");
  std::ostringstream out;
  EngineConfig config;
  EXPECT_FALSE(prompt_config(in, out, config, SetupQuestions{}));
}
