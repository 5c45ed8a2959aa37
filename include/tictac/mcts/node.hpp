#pragma once
#include "../game/tictactoe.hpp"
#include <memory>
#include <optional>
#include <vector>

namespace tictac {

// Copy of a node's statistics that stays valid after the tree changes
struct NodeStats {
    game::State state;
    int simulations;
    double wins;
    bool expanded;
    int num_children;
};

class MCTSNode {
public:
    using Children = std::vector<std::unique_ptr<MCTSNode>>;

    MCTSNode(MCTSNode* parent, game::State state);

    MCTSNode(const MCTSNode&) = delete;
    MCTSNode& operator=(const MCTSNode&) = delete;

    // Tree growth: one child per legal move. Throws if already expanded.
    void expand();

    // UCB selection
    MCTSNode* select_child(double exploration) const;
    double compute_ucb(double exploration, int parent_simulations) const;

    // Statistics
    double win_rate() const;
    void update(double result);

    // Tree structure
    bool is_expanded() const { return children_.has_value(); }
    bool has_children() const { return children_.has_value() && !children_->empty(); }
    MCTSNode* first_unvisited_child() const;
    MCTSNode* most_visited_child() const;
    MCTSNode* find_child(const Board& board) const;
    std::unique_ptr<MCTSNode> release_child(const MCTSNode* child);
    void detach() { parent_ = nullptr; }
    int subtree_size() const;
    NodeStats stats() const;

    // Getters
    MCTSNode* parent() const { return parent_; }
    const game::State& state() const { return state_; }
    int simulations() const { return simulations_; }
    double wins() const { return wins_; }

    // Empty when the node has not been expanded
    const Children& children() const;

private:
    MCTSNode* parent_;
    game::State state_;
    int simulations_;
    double wins_;
    std::optional<Children> children_;
};

} // namespace tictac
