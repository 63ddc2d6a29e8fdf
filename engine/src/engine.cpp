#include "connectk_ai/engine.hpp"
#include "connectk/errors.hpp"
#include "connectk/rules.hpp"
#include <string>

namespace connectk_ai {

using namespace connectk;

namespace {

const EngineConfig& validated(const EngineConfig& config) {
  config.validate();
  return config;
}

} // namespace

Engine::Engine(const EngineConfig& config)
  : config_(validated(config)), mcts_(config.search) {
}

Engine Engine::configure(int width, int height, int connect_length,
                         double exploration_constant, SearchBudget budget, uint64_t seed) {
  EngineConfig config;
  config.width = width;
  config.height = height;
  config.connect_length = connect_length;
  config.budget = budget;
  config.search.exploration_constant = exploration_constant;
  config.search.seed = seed;
  return Engine(config);
}

GameState Engine::new_game() const {
  return GameState(config_.width, config_.height, config_.connect_length);
}

void Engine::check_geometry(const GameState& s) const {
  if (s.width() != config_.width || s.height() != config_.height ||
      s.connect_length() != config_.connect_length) {
    throw ConfigurationError("position is " + std::to_string(s.width()) + "x" +
                             std::to_string(s.height()) + " connect " +
                             std::to_string(s.connect_length()) + " but the engine plays " +
                             std::to_string(config_.width) + "x" + std::to_string(config_.height) +
                             " connect " + std::to_string(config_.connect_length));
  }
}

Move Engine::best_move(const GameState& s) {
  check_geometry(s);
  return mcts_.search(s, config_.budget);
}

Move Engine::best_move(const GameState& s, SearchReport& report) {
  Move m = best_move(s);
  report = mcts_.last_report();
  return m;
}

GameState Engine::apply_move(const GameState& s, const Move& m) const {
  return Rules::apply_move(s, m);
}

GameResult Engine::result(const GameState& s) {
  return Rules::result(s);
}

} // namespace connectk_ai
