#pragma once
#include "../common.hpp"
#include "game.hpp"
#include <vector>
#include <thread>

namespace tictac::selfplay {

/**
 * Parallel batch generator for self-play games.
 *
 * Every game builds and owns its own search tree, so worker threads share
 * nothing but the configuration they copy at launch.
 *
 * When the configuration carries a seed, game i is played with seed + i and
 * the batch is reproducible regardless of the thread count.
 */
class BatchGenerator {
public:
    /**
     * @param config Search configuration used for every game
     * @param num_threads Worker threads; <= 0 picks the hardware concurrency
     */
    explicit BatchGenerator(SearchConfig config, int num_threads = 8);

    /**
     * Play a batch of self-play games in parallel.
     *
     * @param num_games Number of games to play
     * @param iterations_per_move Extra search iterations before each later ply
     * @param temperature Temperature for move selection (0 = robust child)
     * @return BatchResult with the records, in game order, and the tallies
     */
    BatchResult generate_batch(int num_games,
                               int iterations_per_move = 0,
                               float temperature = 0.0f);

    /**
     * Get the number of threads used for parallel generation.
     */
    int num_threads() const { return num_threads_; }

private:
    SearchConfig config_;
    int num_threads_;
};

} // namespace tictac::selfplay
