#include "tictac/mcts/search.hpp"
#include "tictac/util/log.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace tictac {

namespace {

uint32_t make_seed(const SearchConfig& config) {
    if (config.seed.has_value()) {
        return *config.seed;
    }
    std::random_device rd;
    return rd();
}

} // namespace

MCTS::MCTS(SearchConfig config)
    : config_(config), rng_() {
    config_.validate();
    rng_.seed(make_seed(config_));
}

void MCTS::train(SearchTree& tree) {
    train(tree, config_.iterations);
}

void MCTS::train(SearchTree& tree, int iterations) {
    if (iterations < 0) {
        throw std::invalid_argument("iterations must be non-negative");
    }

    for (int i = 0; i < iterations; i++) {
        step(tree);
    }

    if (config_.verbose) {
        TICTAC_INFO("trained " << iterations << " iterations at " << game::to_string(tree.root().state())
                    << ", root simulations " << tree.root().simulations()
                    << ", tree size " << tree.root().subtree_size());
    }
}

int MCTS::train_for(SearchTree& tree,
                    std::chrono::milliseconds time_limit,
                    const std::atomic<bool>* stop) {
    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + time_limit;

    int iterations = 0;
    while (Clock::now() < deadline) {
        if (stop != nullptr && stop->load(std::memory_order_relaxed)) {
            break;
        }
        step(tree);
        iterations++;
    }

    if (config_.verbose) {
        TICTAC_INFO("timed search ran " << iterations << " iterations in " << time_limit.count() << "ms");
    }
    return iterations;
}

void MCTS::step(SearchTree& tree) {
    MCTSNode* root = &tree.root();
    if (!root->is_expanded()) {
        root->expand();
    }

    MCTSNode* node = descend(root);

    // A node is only grown after its own first visit
    if (node->simulations() > 0) {
        if (!node->is_expanded()) {
            node->expand();
        }
        if (node->has_children()) {
            const auto& children = node->children();
            std::uniform_int_distribution<size_t> pick(0, children.size() - 1);
            node = children[pick(rng_)].get();
        }
    }

    double result = rollout(node->state());
    backpropagate(node, result);
}

MCTSNode* MCTS::descend(MCTSNode* root) {
    MCTSNode* node = root;
    while (node->has_children()) {
        // Unvisited children are taken left to right before UCB applies
        if (MCTSNode* unvisited = node->first_unvisited_child()) {
            return unvisited;
        }
        node = node->select_child(config_.exploration);
    }
    return node;
}

double MCTS::rollout(const game::State& start) {
    const Turn mover = start.turn();
    game::State state = start;

    std::optional<Turn> winner;
    while (true) {
        winner = game::winner(state);
        std::vector<Move> moves = game::legal_moves(state);
        if (winner.has_value() || moves.empty()) {
            break;
        }
        std::uniform_int_distribution<size_t> pick(0, moves.size() - 1);
        state = game::apply(moves[pick(rng_)], state);
    }

    if (!winner.has_value()) {
        return 0.5;
    }
    return *winner == mover ? 1.0 : 0.0;
}

void MCTS::backpropagate(MCTSNode* node, double result) {
    // Same score at every ply, relative to the rolled-out node's mover
    for (; node != nullptr; node = node->parent()) {
        node->update(result);
    }
}

Move MCTS::choose_move(SearchTree& tree) {
    MCTSNode& root = tree.root();
    if (game::is_terminal(root.state())) {
        throw std::logic_error("Game is over at " + game::to_string(root.state()));
    }
    if (!root.is_expanded()) {
        root.expand();
    }

    const MCTSNode* best = root.most_visited_child();
    return game::diff_move(root.state().board(), best->state().board());
}

std::array<int, 9> MCTS::visit_counts(const SearchTree& tree) const {
    std::array<int, 9> visits{};
    const MCTSNode& root = tree.root();
    for (const auto& child : root.children()) {
        Move move = game::diff_move(root.state().board(), child->state().board());
        visits[move.index()] = child->simulations();
    }
    return visits;
}

Policy MCTS::action_probs(SearchTree& tree, float temperature) {
    if (temperature < 0.0f) {
        throw std::invalid_argument("temperature must be non-negative");
    }

    Move best = choose_move(tree);
    if (temperature == 0.0f) {
        Policy probs;
        probs.fill(0.0f);
        probs[best.index()] = 1.0f;
        return probs;
    }

    std::array<int, 9> visits = visit_counts(tree);
    if (std::all_of(visits.begin(), visits.end(), [](int v) { return v == 0; })) {
        // Nothing searched yet: uniform over the legal cells
        std::vector<Move> moves = game::legal_moves(tree.root().state());
        Policy probs;
        probs.fill(0.0f);
        for (const Move& move : moves) {
            probs[move.index()] = 1.0f / moves.size();
        }
        return probs;
    }
    return apply_temperature(visits, temperature);
}

Policy MCTS::apply_temperature(const std::array<int, 9>& visits, float temp) const {
    // Boltzmann distribution over visit counts
    Policy probs;
    probs.fill(0.0f);

    // Scaled by the largest count so small temperatures cannot overflow
    const float max_visits = static_cast<float>(*std::max_element(visits.begin(), visits.end()));

    std::array<float, 9> visits_temp{};
    float sum = 0.0f;
    for (int i = 0; i < 9; i++) {
        visits_temp[i] = std::pow(visits[i] / max_visits, 1.0f / temp);
        sum += visits_temp[i];
    }

    for (int i = 0; i < 9; i++) {
        probs[i] = visits_temp[i] / sum;
    }
    return probs;
}

} // namespace tictac
