#include "tictac/selfplay/batch_generator.hpp"
#include "tictac/util/log.hpp"
#include <algorithm>
#include <future>
#include <stdexcept>
#include <utility>

namespace tictac::selfplay {

BatchGenerator::BatchGenerator(SearchConfig config, int num_threads)
    : config_(config), num_threads_(num_threads) {
    config_.validate();

    if (num_threads_ <= 0) {
        num_threads_ = static_cast<int>(std::thread::hardware_concurrency());
        if (num_threads_ <= 0) {
            num_threads_ = 4;  // Fallback
        }
    }
}

BatchResult BatchGenerator::generate_batch(int num_games,
                                           int iterations_per_move,
                                           float temperature) {
    if (num_games < 0) {
        throw std::invalid_argument("num_games must be non-negative");
    }

    const int workers = std::min(num_threads_, std::max(num_games, 1));

    // Each worker plays games worker, worker + workers, ...
    std::vector<std::future<std::vector<std::pair<int, GameRecord>>>> futures;
    for (int worker = 0; worker < workers; worker++) {
        futures.push_back(std::async(std::launch::async, [=]() {
            std::vector<std::pair<int, GameRecord>> played;
            for (int i = worker; i < num_games; i += workers) {
                SearchConfig game_config = config_;
                if (game_config.seed.has_value()) {
                    game_config.seed = *game_config.seed + static_cast<uint32_t>(i);
                }
                SelfPlayGame game(game_config, iterations_per_move, temperature);
                played.emplace_back(i, game.play_game());
            }
            return played;
        }));
    }

    // Collect results from all workers
    BatchResult batch;
    batch.total_games = num_games;
    batch.games.resize(num_games);

    for (auto& future : futures) {
        std::vector<std::pair<int, GameRecord>> played;
        try {
            played = future.get();
        } catch (const std::exception& e) {
            TICTAC_ERROR("self-play worker failed: " << e.what());
            throw;
        }
        for (auto& [index, record] : played) {
            batch.games[index] = std::move(record);
        }
    }

    for (const GameRecord& record : batch.games) {
        if (!record.winner.has_value()) {
            batch.draws++;
        } else if (*record.winner == Turn::X) {
            batch.x_wins++;
        } else {
            batch.o_wins++;
        }
    }

    if (config_.verbose) {
        TICTAC_INFO("batch of " << num_games << " games on " << workers << " threads: X "
                    << batch.x_wins << ", O " << batch.o_wins << ", draws " << batch.draws);
    }
    return batch;
}

} // namespace tictac::selfplay
