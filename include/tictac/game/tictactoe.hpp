#pragma once
#include "../common.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tictac::game {

// Raised when a move targets an occupied or out-of-range cell
class IllegalMoveError : public std::invalid_argument {
public:
    IllegalMoveError(const Move& move, const std::string& reason);

    const Move& move() const { return move_; }

private:
    Move move_;
};

// Immutable position: every transition produces a new State
class State {
public:
    State(const Board& board, Turn turn) : board_(board), turn_(turn) {}

    const Board& board() const { return board_; }
    Turn turn() const { return turn_; }
    Cell at(int row, int col) const { return board_[row * 3 + col]; }

    bool operator==(const State& other) const {
        return turn_ == other.turn_ && board_ == other.board_;
    }
    bool operator!=(const State& other) const { return !(*this == other); }

private:
    Board board_;
    Turn turn_;
};

// Empty board with the given side to move
State initial_state(Turn first_mover = Turn::X);

// Core game functions
std::vector<Move> legal_moves(const State& state);
bool is_legal(const Move& move, const State& state);
State apply(const Move& move, const State& state);
std::optional<Turn> winner(const State& state);
bool is_terminal(const State& state);
bool is_draw(const State& state);

// Utility functions
Move diff_move(const Board& before, const Board& after);
std::string to_string(const State& state);

} // namespace tictac::game
