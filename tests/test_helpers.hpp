#pragma once
#include "tictac/game/tictactoe.hpp"
#include <stdexcept>
#include <string>

namespace tictac::test {

// Builds a board from rows such as "XX./.O./..O"; separators are ignored
inline Board make_board(const std::string& rows) {
    Board board;
    board.fill(Cell::Empty);
    int i = 0;
    for (char c : rows) {
        if (c == '/' || c == ' ') {
            continue;
        }
        if (i >= 9) {
            throw std::invalid_argument("too many cells in " + rows);
        }
        board[i++] = c == 'X' ? Cell::X : c == 'O' ? Cell::O : Cell::Empty;
    }
    if (i != 9) {
        throw std::invalid_argument("expected 9 cells in " + rows);
    }
    return board;
}

inline game::State make_state(const std::string& rows, Turn turn) {
    return game::State(make_board(rows), turn);
}

} // namespace tictac::test
