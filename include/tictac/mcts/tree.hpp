#pragma once
#include "node.hpp"
#include <memory>
#include <vector>

namespace tictac {

// Owns the root of the search and follows the real game as it progresses.
class SearchTree {
public:
    explicit SearchTree(game::State root_state);
    static SearchTree from_empty(Turn first_mover = Turn::X);

    MCTSNode& root() { return *root_; }
    const MCTSNode& root() const { return *root_; }

    // Snapshots of the current root and its children, in enumeration order
    NodeStats root_stats() const;
    std::vector<NodeStats> child_stats() const;

    // Plays a move at the root. The matching child becomes the new root with
    // its statistics; otherwise a fresh root is created. Siblings and the old
    // root are released. Returns true if a subtree was reused.
    bool advance(const Move& move);

    // Discards the whole tree and starts over at the given position.
    void reset(game::State root_state);

private:
    std::unique_ptr<MCTSNode> root_;
};

} // namespace tictac
