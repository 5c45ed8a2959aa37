#include "tictac/mcts/config.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace tictac {

void SearchConfig::validate() const {
    if (iterations < 0) {
        throw std::invalid_argument("iterations must be non-negative, got " + std::to_string(iterations));
    }
    if (!std::isfinite(exploration) || exploration < 0.0) {
        throw std::invalid_argument("exploration must be a finite non-negative number");
    }
}

} // namespace tictac
