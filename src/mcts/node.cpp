#include "tictac/mcts/node.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace tictac {

namespace {
const MCTSNode::Children kNoChildren;
} // namespace

MCTSNode::MCTSNode(MCTSNode* parent, game::State state)
    : parent_(parent), state_(std::move(state)), simulations_(0), wins_(0.0) {}

void MCTSNode::expand() {
    if (is_expanded()) {
        throw std::logic_error("Node is already expanded");
    }
    Children children;
    for (const Move& move : game::legal_moves(state_)) {
        children.push_back(std::make_unique<MCTSNode>(this, game::apply(move, state_)));
    }
    children_ = std::move(children);
}

double MCTSNode::win_rate() const {
    if (simulations_ == 0) {
        return 0.0;
    }
    return wins_ / simulations_;
}

void MCTSNode::update(double result) {
    simulations_++;
    wins_ += result;
}

double MCTSNode::compute_ucb(double exploration, int parent_simulations) const {
    // UCB1: wins / n + C * sqrt(ln(N) / n); an unvisited child always wins the argmax
    if (simulations_ == 0) {
        return std::numeric_limits<double>::infinity();
    }
    double exploit = wins_ / simulations_;
    double explore = exploration * std::sqrt(std::log(static_cast<double>(parent_simulations)) / simulations_);
    return exploit + explore;
}

MCTSNode* MCTSNode::select_child(double exploration) const {
    double best_score = -std::numeric_limits<double>::infinity();
    MCTSNode* best_child = nullptr;

    for (const auto& child : children()) {
        double score = child->compute_ucb(exploration, simulations_);

        // Strict comparison keeps the first maximal child
        if (best_child == nullptr || score > best_score) {
            best_score = score;
            best_child = child.get();
        }
    }

    return best_child;
}

MCTSNode* MCTSNode::first_unvisited_child() const {
    for (const auto& child : children()) {
        if (child->simulations() == 0) {
            return child.get();
        }
    }
    return nullptr;
}

MCTSNode* MCTSNode::most_visited_child() const {
    MCTSNode* best_child = nullptr;
    for (const auto& child : children()) {
        if (best_child == nullptr || child->simulations() > best_child->simulations()) {
            best_child = child.get();
        }
    }
    return best_child;
}

MCTSNode* MCTSNode::find_child(const Board& board) const {
    for (const auto& child : children()) {
        if (child->state().board() == board) {
            return child.get();
        }
    }
    return nullptr;
}

std::unique_ptr<MCTSNode> MCTSNode::release_child(const MCTSNode* child) {
    if (!children_.has_value()) {
        return nullptr;
    }
    auto it = std::find_if(children_->begin(), children_->end(),
                           [child](const std::unique_ptr<MCTSNode>& c) { return c.get() == child; });
    if (it == children_->end()) {
        return nullptr;
    }
    std::unique_ptr<MCTSNode> released = std::move(*it);
    children_->erase(it);
    released->detach();
    return released;
}

int MCTSNode::subtree_size() const {
    int size = 1;
    for (const auto& child : children()) {
        size += child->subtree_size();
    }
    return size;
}

NodeStats MCTSNode::stats() const {
    return NodeStats{state_, simulations_, wins_, is_expanded(), static_cast<int>(children().size())};
}

const MCTSNode::Children& MCTSNode::children() const {
    return children_.has_value() ? *children_ : kNoChildren;
}

} // namespace tictac
