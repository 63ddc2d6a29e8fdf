#include "console_prompt.hpp"
#include "game_session.hpp"
#include "connectk/errors.hpp"
#include "connectk/rules.hpp"
#include "connectk_ai/search_config.hpp"
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

using namespace connectk;
using namespace connectk_ai;
using namespace connectk_play;

namespace {

void print_report(const SearchReport& report) {
  std::cout << "Engine plays " << report.move.col << " after " << report.iterations
            << " iterations (" << report.elapsed_ms << "ms, " << report.tree_size << " nodes)\n";
  for (const auto& c : report.children) {
    std::cout << "  col " << c.move.col << ": visits " << c.visits
              << ", mean reward " << c.mean_reward << "\n";
  }
}

// Play `session` to the end. Returns false if the human quit.
bool play_game(GameSession& session, bool show_stats) {
  std::cout << session.board_text();

  while (!session.is_over()) {
    if (session.is_current_player_engine()) {
      session.play_engine_move();
      if (show_stats) print_report(session.last_report);
      std::cout << session.board_text();
      continue;
    }

    std::cout << "Your move (" << player_symbol(session.state.current_player())
              << ", column 0-" << (session.state.width() - 1) << "): " << std::flush;
    std::string line;
    if (!std::getline(std::cin, line) || line == "q") {
      return false;
    }
    if (line == "u") {
      if (!session.undo()) std::cout << "Nothing to take back.\n";
      std::cout << session.board_text();
      continue;
    }

    std::string err;
    if (!session.apply_move_text(line, err)) {
      std::cout << "Invalid move: " << err << "\n";
      continue;
    }
    std::cout << session.board_text();
  }

  std::cout << session.status_text() << "\n";
  return true;
}

} // namespace

/**
 * Human vs engine in the terminal.
 *
 *   ./connectk_play --width 7 --height 6 --connect 4 --iterations 5000
 *   ./connectk_play --time-ms 1500 --engine-first
 *
 * Board size, K, iterations and move order are asked for interactively
 * when not given. During play enter a column number, 'u' to take back,
 * 'q' to quit.
 */
int main(int argc, char* argv[]) {
  EngineConfig config;
  SetupQuestions ask;
  int first = -1;  // -1 ask, 0 human, 1 engine
  bool show_stats = false;

  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--width") == 0 && i + 1 < argc) {
      config.width = std::atoi(argv[++i]);
      ask.board_size = false;
    } else if (std::strcmp(argv[i], "--height") == 0 && i + 1 < argc) {
      config.height = std::atoi(argv[++i]);
      ask.board_size = false;
    } else if (std::strcmp(argv[i], "--connect") == 0 && i + 1 < argc) {
      config.connect_length = std::atoi(argv[++i]);
      ask.connect_length = false;
    } else if (std::strcmp(argv[i], "--iterations") == 0 && i + 1 < argc) {
      config.budget = SearchBudget::iterations(std::atoll(argv[++i]));
      ask.iterations = false;
    } else if (std::strcmp(argv[i], "--time-ms") == 0 && i + 1 < argc) {
      config.budget = SearchBudget::time_millis(std::atoll(argv[++i]));
      ask.iterations = false;
    } else if (std::strcmp(argv[i], "--exploration") == 0 && i + 1 < argc) {
      config.search.exploration_constant = std::atof(argv[++i]);
    } else if (std::strcmp(argv[i], "--seed") == 0 && i + 1 < argc) {
      config.search.seed = std::strtoull(argv[++i], nullptr, 10);
    } else if (std::strcmp(argv[i], "--human-first") == 0) {
      first = 0;
    } else if (std::strcmp(argv[i], "--engine-first") == 0) {
      first = 1;
    } else if (std::strcmp(argv[i], "--stats") == 0) {
      show_stats = true;
    } else if (std::strcmp(argv[i], "--verbose") == 0) {
      config.search.verbose = true;
    } else if (std::strcmp(argv[i], "--help") == 0) {
      std::cout << "Usage: " << argv[0] << " [options]\n";
      std::cout << "Options:\n";
      std::cout << "  --width N          Board width (asked if omitted)\n";
      std::cout << "  --height N         Board height (asked if omitted)\n";
      std::cout << "  --connect K        Tokens in a row to win (asked if omitted)\n";
      std::cout << "  --iterations N     Engine iterations per move (asked if omitted)\n";
      std::cout << "  --time-ms MS       Engine thinking time per move instead of iterations\n";
      std::cout << "  --exploration C    UCB1 exploration constant (default: 1.414)\n";
      std::cout << "  --seed S           Random seed (default: 0)\n";
      std::cout << "  --human-first      Human plays X and moves first\n";
      std::cout << "  --engine-first     Engine plays X and moves first\n";
      std::cout << "  --stats            Print root statistics after each engine move\n";
      std::cout << "  --verbose          Engine search log\n";
      std::cout << "  --help             Show this help message\n";
      return 0;
    }
  }

  if (!prompt_config(std::cin, std::cout, config, ask)) return 0;
  if (first < 0) {
    bool human_first = true;
    if (!prompt_yes(std::cin, std::cout, "Would you like to go first? ", human_first)) return 0;
    first = human_first ? 0 : 1;
  }

  Controller a = first == 0 ? Controller::Human : Controller::Engine;
  Controller b = first == 0 ? Controller::Engine : Controller::Human;

  try {
    GameSession session(config, a, b);
    for (;;) {
      if (!play_game(session, show_stats)) {
        std::cout << "\nBye.\n";
        return 0;
      }
      bool again = false;
      if (!prompt_yes(std::cin, std::cout, "Play again? ", again) || !again) break;
      session.reset();
    }
  } catch (const ConfigurationError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
