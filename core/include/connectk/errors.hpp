#pragma once
#include <stdexcept>
#include <string>

namespace connectk {

// Move names an out-of-range or full column, or the game is already over.
class InvalidMoveError : public std::runtime_error {
public:
  explicit InvalidMoveError(const std::string& what) : std::runtime_error(what) {}
};

// Invalid board geometry or search parameters.
class ConfigurationError : public std::runtime_error {
public:
  explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

// A move was requested for a position that is already decided.
class NoMovesAvailableError : public std::runtime_error {
public:
  explicit NoMovesAvailableError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace connectk
