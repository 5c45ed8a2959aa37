#pragma once
#include "config.hpp"
#include "tree.hpp"
#include "../common.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <random>

namespace tictac {

class MCTS {
public:
    explicit MCTS(SearchConfig config = SearchConfig());

    // One iteration: descend, expand, roll out, backpropagate
    void step(SearchTree& tree);

    // Run a fixed budget of iterations in place
    void train(SearchTree& tree);
    void train(SearchTree& tree, int iterations);

    // Run until the time limit expires or *stop becomes true.
    // Returns the number of iterations performed.
    int train_for(SearchTree& tree,
                  std::chrono::milliseconds time_limit,
                  const std::atomic<bool>* stop = nullptr);

    // Robust child: the most simulated move at the root
    Move choose_move(SearchTree& tree);

    // Root statistics per cell (0 for occupied cells)
    std::array<int, 9> visit_counts(const SearchTree& tree) const;
    Policy action_probs(SearchTree& tree, float temperature);

    const SearchConfig& config() const { return config_; }

private:
    MCTSNode* descend(MCTSNode* root);
    double rollout(const game::State& state);
    void backpropagate(MCTSNode* node, double result);
    Policy apply_temperature(const std::array<int, 9>& visits, float temp) const;

    SearchConfig config_;
    std::mt19937 rng_;
};

} // namespace tictac
