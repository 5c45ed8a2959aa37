#include "tictac/selfplay/game.hpp"
#include "tictac/game/tictactoe.hpp"
#include "tictac/util/log.hpp"
#include <stdexcept>

namespace tictac::selfplay {

SelfPlayGame::SelfPlayGame(SearchConfig config,
                           int iterations_per_move,
                           float temperature,
                           Turn first_mover)
    : config_(config),
      iterations_per_move_(iterations_per_move),
      temperature_(temperature),
      first_mover_(first_mover),
      rng_(),
      game_result_(std::nullopt) {
    config_.validate();
    if (iterations_per_move_ < 0) {
        throw std::invalid_argument("iterations_per_move must be non-negative");
    }
    if (temperature_ < 0.0f) {
        throw std::invalid_argument("temperature must be non-negative");
    }
    // Offset so move sampling does not replay the search's random stream
    rng_.seed(config_.seed.has_value() ? *config_.seed + 0x9e3779b9u : std::random_device{}());
}

GameRecord SelfPlayGame::play_game() {
    MCTS mcts(config_);
    SearchTree tree = SearchTree::from_empty(first_mover_);
    mcts.train(tree);

    GameRecord record;
    while (!game::is_terminal(tree.root().state())) {
        if (iterations_per_move_ > 0 && record.plies > 0) {
            mcts.train(tree, iterations_per_move_);
        }

        Move move;
        if (temperature_ == 0.0f) {
            move = mcts.choose_move(tree);
        } else {
            // Sample move from MCTS policy
            Policy policy = mcts.action_probs(tree, temperature_);
            std::discrete_distribution<int> dist(policy.begin(), policy.end());
            move = Move::from_index(dist(rng_));
        }

        if (tree.advance(move)) {
            record.reused_plies++;
        }
        record.moves.push_back(move);
        record.plies++;
    }

    game_result_ = game::winner(tree.root().state());
    record.winner = game_result_;

    if (config_.verbose) {
        TICTAC_INFO("self-play finished after " << record.plies << " plies: "
                    << game::to_string(tree.root().state()) << ", "
                    << (!record.winner ? "draw" : (*record.winner == Turn::X ? "X wins" : "O wins")));
    }
    return record;
}

} // namespace tictac::selfplay
