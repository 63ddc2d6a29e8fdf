#pragma once
#include "connectk_ai/search_config.hpp"
#include <iosfwd>
#include <string>

namespace connectk_play {

// Whole-line integer: surrounding blanks allowed, nothing else ("7abc" fails).
bool parse_int(const std::string& text, int& out);

// Ask until a whole-line integer arrives. An empty line keeps `value`.
// Returns false on end of input.
bool prompt_int(std::istream& in, std::ostream& out, const std::string& question, int& value);

// y/Y... is yes, anything else no. Returns false on end of input.
bool prompt_yes(std::istream& in, std::ostream& out, const std::string& question, bool& answer);

// Settings still to be asked for; the rest came from the command line.
struct SetupQuestions {
  bool board_size = true;
  bool connect_length = true;
  bool iterations = true;
};

// Ask for the open settings, then validate the whole config. On a
// ConfigurationError print it and ask for every setting again.
// Returns false on end of input.
bool prompt_config(std::istream& in, std::ostream& out,
                   connectk_ai::EngineConfig& config, SetupQuestions ask);

} // namespace connectk_play
