#include "arena_stats.hpp"
#include "connectk/game_state.hpp"
#include "connectk/rules.hpp"
#include "connectk/errors.hpp"
#include "connectk_ai/engine.hpp"
#include "connectk_ai/random_policy.hpp"
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

using namespace connectk;
using namespace connectk_ai;
using connectk_arena::ArenaStats;

// One side of a match: an engine, or a random mover when engine is null.
struct Contestant {
  std::string name;
  std::unique_ptr<Engine> engine;
  std::unique_ptr<RandomPolicy> random;

  Move pick(const GameState& s) {
    return engine ? engine->best_move(s) : random->pick(s);
  }
};

GameResult play_game(Contestant& x, Contestant& o, const GameState& start, int& moves, bool verbose) {
  GameState state = start;
  moves = 0;

  while (!Rules::is_terminal(state)) {
    Contestant& side = (state.current_player() == Player::A) ? x : o;
    Move move = side.pick(state);
    if (verbose) {
      std::cout << "Move " << (moves + 1) << ": " << player_symbol(state.current_player())
                << " (" << side.name << ") -> column " << move.col << "\n";
    }
    state = Rules::apply_move(state, move);
    moves++;
  }

  if (verbose) {
    std::cout << state.to_string() << "---\n";
  }
  return Rules::result(state);
}

/**
 * Engine vs random or engine vs engine matches.
 *
 * --games N          : games to play (colors alternate every game)
 * --opponent TYPE    : random or mcts
 * --iterations N     : iterations per move for the first engine
 * --opp-iterations N : iterations per move for the opponent engine
 *
 * Example:
 *   ./connectk_arena --games 50 --opponent mcts --iterations 4000 --opp-iterations 500
 */
int main(int argc, char** argv) {
  EngineConfig config;
  EngineConfig opp_config;
  int num_games = 20;
  bool verbose = false;
  std::string opponent = "random";
  bool opp_iterations_set = false;

  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--games") == 0 && i + 1 < argc) {
      num_games = std::atoi(argv[++i]);
    } else if (std::strcmp(argv[i], "--opponent") == 0 && i + 1 < argc) {
      opponent = argv[++i];
    } else if (std::strcmp(argv[i], "--width") == 0 && i + 1 < argc) {
      config.width = std::atoi(argv[++i]);
    } else if (std::strcmp(argv[i], "--height") == 0 && i + 1 < argc) {
      config.height = std::atoi(argv[++i]);
    } else if (std::strcmp(argv[i], "--connect") == 0 && i + 1 < argc) {
      config.connect_length = std::atoi(argv[++i]);
    } else if (std::strcmp(argv[i], "--iterations") == 0 && i + 1 < argc) {
      config.budget = SearchBudget::iterations(std::atoll(argv[++i]));
    } else if (std::strcmp(argv[i], "--opp-iterations") == 0 && i + 1 < argc) {
      opp_config.budget = SearchBudget::iterations(std::atoll(argv[++i]));
      opp_iterations_set = true;
    } else if (std::strcmp(argv[i], "--exploration") == 0 && i + 1 < argc) {
      config.search.exploration_constant = std::atof(argv[++i]);
    } else if (std::strcmp(argv[i], "--seed") == 0 && i + 1 < argc) {
      config.search.seed = std::strtoull(argv[++i], nullptr, 10);
    } else if (std::strcmp(argv[i], "--verbose") == 0) {
      verbose = true;
    } else if (std::strcmp(argv[i], "--help") == 0) {
      std::cout << "Usage: " << argv[0] << " [options]\n";
      std::cout << "Options:\n";
      std::cout << "  --games <n>            Number of games to play (default: 20)\n";
      std::cout << "  --opponent <type>      Opponent type: random or mcts (default: random)\n";
      std::cout << "  --width <n>            Board width (default: 7)\n";
      std::cout << "  --height <n>           Board height (default: 6)\n";
      std::cout << "  --connect <k>          Tokens in a row to win (default: 4)\n";
      std::cout << "  --iterations <n>       Iterations per move (default: 2000)\n";
      std::cout << "  --opp-iterations <n>   Opponent engine iterations per move (default: same)\n";
      std::cout << "  --exploration <c>      UCB1 exploration constant (default: 1.414)\n";
      std::cout << "  --seed <s>             Base random seed (default: 0)\n";
      std::cout << "  --verbose              Print every move\n";
      std::cout << "  --help                 Show this help message\n";
      return 0;
    }
  }

  if (opponent != "random" && opponent != "mcts") {
    std::cerr << "Error: Unknown opponent type: " << opponent << "\n";
    return 1;
  }
  if (num_games < 1) {
    std::cerr << "Error: --games must be positive\n";
    return 1;
  }

  opp_config.width = config.width;
  opp_config.height = config.height;
  opp_config.connect_length = config.connect_length;
  opp_config.search = config.search;
  opp_config.search.seed = config.search.seed + 1;
  if (!opp_iterations_set) opp_config.budget = config.budget;

  ArenaStats stats;

  try {
    for (int g = 0; g < num_games; ++g) {
      // Fresh contestants per game so trees never leak across games.
      EngineConfig game_config = config;
      game_config.search.seed = config.search.seed + 2 * static_cast<uint64_t>(g);
      Contestant engine{"MCTS", std::make_unique<Engine>(game_config), nullptr};

      Contestant other;
      if (opponent == "mcts") {
        EngineConfig c = opp_config;
        c.search.seed = opp_config.search.seed + 2 * static_cast<uint64_t>(g);
        other = Contestant{"MCTS-opponent", std::make_unique<Engine>(c), nullptr};
      } else {
        other = Contestant{"Random", nullptr, std::make_unique<RandomPolicy>(config.search.seed + g)};
      }

      const bool engine_is_x = (g % 2 == 0);
      Contestant& x = engine_is_x ? engine : other;
      Contestant& o = engine_is_x ? other : engine;

      if ((g + 1) % 5 == 0 || verbose) {
        std::cout << "Playing game " << (g + 1) << "/" << num_games << "...\n";
      }

      int moves = 0;
      GameResult r = play_game(x, o, engine.engine->new_game(), moves, verbose);
      stats.record(r, engine_is_x ? Player::A : Player::B, moves);
    }
  } catch (const ConfigurationError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << "\n";
    return 1;
  }

  stats.print(opponent);

  return 0;
}
