#pragma once
#include <cstdint>
#include <optional>

namespace tictac {

struct SearchConfig {
    int iterations = 10000;                // default budget for MCTS::train(tree)
    double exploration = 10.0;             // UCB1 constant C, sqrt(100)
    std::optional<uint32_t> seed;          // nullopt seeds from std::random_device
    bool verbose = false;

    // Throws std::invalid_argument on an unusable configuration
    void validate() const;
};

} // namespace tictac
