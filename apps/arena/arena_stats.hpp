#pragma once
#include "connectk/types.hpp"
#include <algorithm>
#include <iostream>
#include <string>

namespace connectk_arena {

// Match record of the first engine, split by the color it played.
struct ArenaStats {
  struct Record {
    int wins = 0;
    int losses = 0;
    int draws = 0;

    int games() const { return wins + losses + draws; }
  };

  Record as_x;
  Record as_o;
  int total_moves = 0;
  int shortest = 0;
  int longest = 0;

  void record(const connectk::GameResult& r, connectk::Player engine_side, int moves) {
    Record& rec = (engine_side == connectk::Player::A) ? as_x : as_o;
    if (r.is_draw()) {
      rec.draws++;
    } else if (r.is_win_for(engine_side)) {
      rec.wins++;
    } else {
      rec.losses++;
    }

    shortest = (games() == 1) ? moves : std::min(shortest, moves);
    longest = std::max(longest, moves);
    total_moves += moves;
  }

  int games() const { return as_x.games() + as_o.games(); }

  static void print_record(std::ostream& out, const char* label, const Record& rec) {
    const int n = rec.games();
    out << "  " << label << rec.wins << "-" << rec.losses << "-" << rec.draws;
    if (n > 0) {
      out << " (" << (100.0 * rec.wins / n) << "% won)";
    }
    out << "\n";
  }

  void print(const std::string& opponent, std::ostream& out = std::cout) const {
    Record all;
    all.wins = as_x.wins + as_o.wins;
    all.losses = as_x.losses + as_o.losses;
    all.draws = as_x.draws + as_o.draws;

    out << "\nMCTS vs " << opponent << " after " << games() << " games (win-loss-draw):\n";
    print_record(out, "As X:  ", as_x);
    print_record(out, "As O:  ", as_o);
    print_record(out, "Total: ", all);
    out << "  Game length: avg " << (games() > 0 ? static_cast<double>(total_moves) / games() : 0.0)
        << ", shortest " << shortest << ", longest " << longest << "\n";
  }
};

} // namespace connectk_arena
