#include "console_prompt.hpp"
#include "connectk/errors.hpp"
#include <cctype>
#include <climits>
#include <cstdlib>
#include <istream>
#include <ostream>
#include <stdexcept>

namespace connectk_play {

using connectk_ai::EngineConfig;
using connectk_ai::SearchBudget;

namespace {

std::string trim(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

} // namespace

bool parse_int(const std::string& text, int& out) {
  const std::string s = trim(text);
  if (s.empty()) return false;

  size_t pos = 0;
  long long v = 0;
  try {
    v = std::stoll(s, &pos);
  } catch (const std::logic_error&) {
    // invalid_argument or out_of_range
    return false;
  }
  if (pos != s.size() || v < INT_MIN || v > INT_MAX) return false;
  out = static_cast<int>(v);
  return true;
}

bool prompt_int(std::istream& in, std::ostream& out, const std::string& question, int& value) {
  std::string line;
  for (;;) {
    out << question << "[" << value << "] " << std::flush;
    if (!std::getline(in, line)) return false;
    if (trim(line).empty()) return true;
    if (parse_int(line, value)) return true;
    out << "Invalid input. Please retry.\n";
  }
}

bool prompt_yes(std::istream& in, std::ostream& out, const std::string& question, bool& answer) {
  std::string line;
  out << question << std::flush;
  if (!std::getline(in, line)) return false;
  const std::string s = trim(line);
  answer = !s.empty() && (s[0] == 'y' || s[0] == 'Y');
  return true;
}

bool prompt_config(std::istream& in, std::ostream& out, EngineConfig& config, SetupQuestions ask) {
  for (;;) {
    if (ask.board_size) {
      if (!prompt_int(in, out, "How tall would you like your board to be? ", config.height)) return false;
      if (!prompt_int(in, out, "How wide would you like your board to be? ", config.width)) return false;
    }
    if (ask.connect_length) {
      if (!prompt_int(in, out, "How many in a row to win? ", config.connect_length)) return false;
    }
    if (ask.iterations) {
      int n = config.budget.is_time() ? 2000 : static_cast<int>(config.budget.amount);
      if (!prompt_int(in, out, "How many iterations may the engine think per move? ", n)) return false;
      config.budget = SearchBudget::iterations(n);
    }

    try {
      config.validate();
      return true;
    } catch (const connectk::ConfigurationError& e) {
      out << "Invalid setup: " << e.what() << ". Please retry.\n";
    }
    ask = SetupQuestions{};
  }
}

} // namespace connectk_play
