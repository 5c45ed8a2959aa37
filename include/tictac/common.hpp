#pragma once
#include <vector>
#include <array>
#include <cstdint>
#include <optional>

namespace tictac {

// Cell values stored on the board
enum class Cell : int8_t { Empty = 0, X = 1, O = 2 };

// Side to move
enum class Turn : int8_t { X = 1, O = 2 };

// Board representation (flat array, row-major)
using Board = std::array<Cell, 9>;

// Policy is 9 floats (probability for each cell)
using Policy = std::array<float, 9>;

struct Move {
    int row;
    int col;

    int index() const { return row * 3 + col; }
    static Move from_index(int index) { return Move{index / 3, index % 3}; }

    bool operator==(const Move& other) const { return row == other.row && col == other.col; }
    bool operator!=(const Move& other) const { return !(*this == other); }
};

inline Cell cell_of(Turn turn) {
    return turn == Turn::X ? Cell::X : Cell::O;
}

inline Turn opponent(Turn turn) {
    return turn == Turn::X ? Turn::O : Turn::X;
}

// Finished self-play game
struct GameRecord {
    std::vector<Move> moves;
    std::optional<Turn> winner;  // nullopt on a draw
    int plies = 0;
    int reused_plies = 0;        // plies where the search subtree survived the advance
};

// Results from multiple games
struct BatchResult {
    std::vector<GameRecord> games;
    int total_games = 0;
    int x_wins = 0;
    int o_wins = 0;
    int draws = 0;
};

} // namespace tictac
