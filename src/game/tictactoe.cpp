#include "tictac/game/tictactoe.hpp"
#include <algorithm>

namespace tictac::game {

namespace {

std::string describe(const Move& move, const std::string& reason) {
    return "Illegal move (" + std::to_string(move.row) + ", " + std::to_string(move.col) + "): " + reason;
}

char symbol(Cell cell) {
    switch (cell) {
        case Cell::X: return 'X';
        case Cell::O: return 'O';
        default: return '.';
    }
}

std::optional<Turn> check_winner(const Board& board) {
    // Check all winning combinations
    const int wins[][3] = {
        {0, 1, 2}, {3, 4, 5}, {6, 7, 8},  // rows
        {0, 3, 6}, {1, 4, 7}, {2, 5, 8},  // cols
        {0, 4, 8}, {2, 4, 6}              // diagonals
    };

    for (const auto& win : wins) {
        int a = win[0], b = win[1], c = win[2];
        if (board[a] == board[b] && board[b] == board[c] && board[a] != Cell::Empty) {
            return board[a] == Cell::X ? Turn::X : Turn::O;
        }
    }

    return std::nullopt;
}

std::vector<Move> get_valid_moves(const Board& board) {
    std::vector<Move> moves;
    for (int i = 0; i < 9; i++) {
        if (board[i] == Cell::Empty) {
            moves.push_back(Move::from_index(i));
        }
    }
    return moves;
}

} // namespace

IllegalMoveError::IllegalMoveError(const Move& move, const std::string& reason)
    : std::invalid_argument(describe(move, reason)), move_(move) {}

State initial_state(Turn first_mover) {
    Board board;
    board.fill(Cell::Empty);
    return State(board, first_mover);
}

std::vector<Move> legal_moves(const State& state) {
    return get_valid_moves(state.board());
}

bool is_legal(const Move& move, const State& state) {
    return move.row >= 0 && move.row < 3 && move.col >= 0 && move.col < 3 &&
           state.board()[move.index()] == Cell::Empty;
}

State apply(const Move& move, const State& state) {
    if (move.row < 0 || move.row >= 3 || move.col < 0 || move.col >= 3) {
        throw IllegalMoveError(move, "coordinates out of range");
    }
    if (state.board()[move.index()] != Cell::Empty) {
        throw IllegalMoveError(move, "cell already occupied");
    }
    Board board = state.board();
    board[move.index()] = cell_of(state.turn());
    return State(board, opponent(state.turn()));
}

std::optional<Turn> winner(const State& state) {
    return check_winner(state.board());
}

bool is_terminal(const State& state) {
    return winner(state).has_value() || legal_moves(state).empty();
}

bool is_draw(const State& state) {
    return !winner(state).has_value() && legal_moves(state).empty();
}

// Utility functions

Move diff_move(const Board& before, const Board& after) {
    std::optional<Move> changed;
    for (int i = 0; i < 9; i++) {
        if (before[i] == after[i]) {
            continue;
        }
        if (changed.has_value() || before[i] != Cell::Empty) {
            throw std::invalid_argument("Boards do not differ by exactly one placed piece");
        }
        changed = Move::from_index(i);
    }
    if (!changed.has_value()) {
        throw std::invalid_argument("Boards are identical");
    }
    return *changed;
}

std::string to_string(const State& state) {
    std::string out;
    for (int i = 0; i < 9; i++) {
        if (i > 0 && i % 3 == 0) {
            out += '/';
        }
        out += symbol(state.board()[i]);
    }
    out += state.turn() == Turn::X ? " X" : " O";
    return out;
}

} // namespace tictac::game
