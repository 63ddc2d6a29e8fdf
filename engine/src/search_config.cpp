#include "connectk_ai/search_config.hpp"
#include "connectk/errors.hpp"
#include <algorithm>
#include <string>

namespace connectk_ai {

void EngineConfig::validate() const {
  using connectk::ConfigurationError;

  if (width < 1 || height < 1) {
    throw ConfigurationError("board must be at least 1x1, got " +
                             std::to_string(width) + "x" + std::to_string(height));
  }
  if (connect_length < 1 || connect_length > std::max(width, height)) {
    throw ConfigurationError("connect length " + std::to_string(connect_length) +
                             " does not fit a " + std::to_string(width) + "x" +
                             std::to_string(height) + " board");
  }
  if (budget.amount < 1) {
    throw ConfigurationError(std::string("search budget must be positive, got ") +
                             std::to_string(budget.amount) +
                             (budget.is_time() ? " ms" : " iterations"));
  }
  if (!std::isfinite(search.exploration_constant) || search.exploration_constant < 0.0) {
    throw ConfigurationError("exploration constant must be a finite non-negative number");
  }
  if (!std::isfinite(search.loss_reward) || search.loss_reward > 0.0) {
    throw ConfigurationError("loss reward must be finite and not exceed the draw reward 0");
  }
}

} // namespace connectk_ai
