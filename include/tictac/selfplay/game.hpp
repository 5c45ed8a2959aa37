#pragma once
#include "../mcts/search.hpp"
#include "../common.hpp"
#include <optional>
#include <random>

namespace tictac::selfplay {

class SelfPlayGame {
public:
    SelfPlayGame(SearchConfig config,
                 int iterations_per_move = 0,
                 float temperature = 0.0f,
                 Turn first_mover = Turn::X);

    // Train once from the empty board, then play the engine against itself
    GameRecord play_game();

    // Winner of the last game, nullopt on a draw
    std::optional<Turn> get_game_result() const { return game_result_; }

private:
    SearchConfig config_;
    int iterations_per_move_;
    float temperature_;
    Turn first_mover_;
    std::mt19937 rng_;
    std::optional<Turn> game_result_;
};

} // namespace tictac::selfplay
