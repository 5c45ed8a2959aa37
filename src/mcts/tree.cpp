#include "tictac/mcts/tree.hpp"
#include "tictac/util/log.hpp"
#include <utility>

namespace tictac {

SearchTree::SearchTree(game::State root_state)
    : root_(std::make_unique<MCTSNode>(nullptr, std::move(root_state))) {}

SearchTree SearchTree::from_empty(Turn first_mover) {
    return SearchTree(game::initial_state(first_mover));
}

NodeStats SearchTree::root_stats() const {
    return root_->stats();
}

std::vector<NodeStats> SearchTree::child_stats() const {
    std::vector<NodeStats> stats;
    for (const auto& child : root_->children()) {
        stats.push_back(child->stats());
    }
    return stats;
}

bool SearchTree::advance(const Move& move) {
    // Throws IllegalMoveError before the tree is touched
    game::State next = game::apply(move, root_->state());

    std::unique_ptr<MCTSNode> new_root;
    if (MCTSNode* child = root_->find_child(next.board())) {
        new_root = root_->release_child(child);
    }

    bool reused = new_root != nullptr;
    if (!reused) {
        new_root = std::make_unique<MCTSNode>(nullptr, std::move(next));
    }
    root_ = std::move(new_root);
    TICTAC_DEBUG("advanced to " << game::to_string(root_->state())
                 << (reused ? ", reused " : ", fresh root, ") << root_->simulations() << " simulations");
    return reused;
}

void SearchTree::reset(game::State root_state) {
    root_ = std::make_unique<MCTSNode>(nullptr, std::move(root_state));
}

} // namespace tictac
