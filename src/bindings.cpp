#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/operators.h>
#include "tictac/common.hpp"
#include "tictac/game/tictactoe.hpp"
#include "tictac/mcts/config.hpp"
#include "tictac/mcts/node.hpp"
#include "tictac/mcts/tree.hpp"
#include "tictac/mcts/search.hpp"
#include "tictac/selfplay/game.hpp"
#include "tictac/selfplay/batch_generator.hpp"

namespace py = pybind11;

PYBIND11_MODULE(tictac_cpp, m) {
    m.doc() = "C++ MCTS engine for Tic-Tac-Toe";

    py::register_exception<tictac::game::IllegalMoveError>(m, "IllegalMoveError", PyExc_ValueError);

    py::enum_<tictac::Turn>(m, "Turn")
        .value("X", tictac::Turn::X)
        .value("O", tictac::Turn::O);

    py::enum_<tictac::Cell>(m, "Cell")
        .value("EMPTY", tictac::Cell::Empty)
        .value("X", tictac::Cell::X)
        .value("O", tictac::Cell::O);

    // Move struct
    py::class_<tictac::Move>(m, "Move")
        .def(py::init([](int row, int col) { return tictac::Move{row, col}; }),
             py::arg("row"), py::arg("col"))
        .def_readwrite("row", &tictac::Move::row)
        .def_readwrite("col", &tictac::Move::col)
        .def("index", &tictac::Move::index)
        .def(py::self == py::self)
        .def("__repr__", [](const tictac::Move& move) {
            return "Move(" + std::to_string(move.row) + ", " + std::to_string(move.col) + ")";
        });

    // Immutable game state
    py::class_<tictac::game::State>(m, "State")
        .def(py::init<const tictac::Board&, tictac::Turn>(), py::arg("board"), py::arg("turn"))
        .def_property_readonly("board", &tictac::game::State::board)
        .def_property_readonly("turn", &tictac::game::State::turn)
        .def("at", &tictac::game::State::at, py::arg("row"), py::arg("col"))
        .def(py::self == py::self)
        .def("__repr__", &tictac::game::to_string);

    // Game functions
    m.def("initial_state", &tictac::game::initial_state, py::arg("first_mover") = tictac::Turn::X,
          "Empty board with the given side to move");
    m.def("legal_moves", &tictac::game::legal_moves, py::arg("state"), "Empty cells in row-major order");
    m.def("apply", &tictac::game::apply, py::arg("move"), py::arg("state"), "Play a move, returning a new state");
    m.def("winner", &tictac::game::winner, py::arg("state"), "Side owning a completed line, or None");
    m.def("is_terminal", &tictac::game::is_terminal, py::arg("state"), "Check if game is over");
    m.def("is_draw", &tictac::game::is_draw, py::arg("state"), "Full board without a winner");

    // SearchConfig struct
    py::class_<tictac::SearchConfig>(m, "SearchConfig")
        .def(py::init([](int iterations, double exploration, std::optional<uint32_t> seed, bool verbose) {
                 tictac::SearchConfig config;
                 config.iterations = iterations;
                 config.exploration = exploration;
                 config.seed = seed;
                 config.verbose = verbose;
                 config.validate();
                 return config;
             }),
             py::arg("iterations") = 10000,
             py::arg("exploration") = 10.0,
             py::arg("seed") = py::none(),
             py::arg("verbose") = false)
        .def_readwrite("iterations", &tictac::SearchConfig::iterations)
        .def_readwrite("exploration", &tictac::SearchConfig::exploration)
        .def_readwrite("seed", &tictac::SearchConfig::seed)
        .def_readwrite("verbose", &tictac::SearchConfig::verbose);

    // Node statistics are copied out; Python never holds a pointer into the tree
    py::class_<tictac::NodeStats>(m, "NodeStats")
        .def_readonly("state", &tictac::NodeStats::state)
        .def_readonly("simulations", &tictac::NodeStats::simulations)
        .def_readonly("wins", &tictac::NodeStats::wins)
        .def_readonly("expanded", &tictac::NodeStats::expanded)
        .def_readonly("num_children", &tictac::NodeStats::num_children)
        .def_property_readonly("win_rate", [](const tictac::NodeStats& stats) {
            return stats.simulations == 0 ? 0.0 : stats.wins / stats.simulations;
        });

    py::class_<tictac::SearchTree>(m, "SearchTree")
        .def(py::init<tictac::game::State>(), py::arg("root_state"))
        .def_static("from_empty", &tictac::SearchTree::from_empty, py::arg("first_mover") = tictac::Turn::X)
        .def("root_stats", &tictac::SearchTree::root_stats, "Snapshot of the current root")
        .def("child_stats", &tictac::SearchTree::child_stats, "Snapshots of the root's children")
        .def("subtree_size", [](const tictac::SearchTree& tree) { return tree.root().subtree_size(); })
        .def("advance", &tictac::SearchTree::advance, py::arg("move"),
             "Play a move at the root; returns True if the subtree was reused")
        .def("reset", &tictac::SearchTree::reset, py::arg("root_state"));

    // MCTS search
    py::class_<tictac::MCTS>(m, "MCTS")
        .def(py::init<tictac::SearchConfig>(), py::arg("config") = tictac::SearchConfig())
        .def("step", &tictac::MCTS::step, py::arg("tree"))
        .def("train", py::overload_cast<tictac::SearchTree&, int>(&tictac::MCTS::train),
             py::arg("tree"), py::arg("iterations"),
             py::call_guard<py::gil_scoped_release>())
        .def("train", py::overload_cast<tictac::SearchTree&>(&tictac::MCTS::train),
             py::arg("tree"),
             py::call_guard<py::gil_scoped_release>())
        .def("train_for",
             [](tictac::MCTS& mcts, tictac::SearchTree& tree, std::chrono::milliseconds limit) {
                 py::gil_scoped_release release;
                 return mcts.train_for(tree, limit);
             },
             py::arg("tree"), py::arg("time_limit"))
        .def("choose_move", &tictac::MCTS::choose_move, py::arg("tree"))
        .def("visit_counts", &tictac::MCTS::visit_counts, py::arg("tree"))
        .def("action_probs", &tictac::MCTS::action_probs, py::arg("tree"), py::arg("temperature") = 1.0f)
        .def_property_readonly("config", &tictac::MCTS::config);

    // GameRecord struct
    py::class_<tictac::GameRecord>(m, "GameRecord")
        .def(py::init<>())
        .def_readwrite("moves", &tictac::GameRecord::moves, "Moves in play order")
        .def_readwrite("winner", &tictac::GameRecord::winner, "Winning side, None on a draw")
        .def_readwrite("plies", &tictac::GameRecord::plies)
        .def_readwrite("reused_plies", &tictac::GameRecord::reused_plies,
                       "Plies where the search subtree survived the advance");

    // BatchResult struct
    py::class_<tictac::BatchResult>(m, "BatchResult")
        .def(py::init<>())
        .def_readwrite("games", &tictac::BatchResult::games, "List of game records")
        .def_readwrite("total_games", &tictac::BatchResult::total_games, "Total number of games played")
        .def_readwrite("x_wins", &tictac::BatchResult::x_wins, "X wins")
        .def_readwrite("o_wins", &tictac::BatchResult::o_wins, "O wins")
        .def_readwrite("draws", &tictac::BatchResult::draws, "Number of draws");

    // SelfPlayGame
    py::class_<tictac::selfplay::SelfPlayGame>(m, "SelfPlayGame")
        .def(py::init<tictac::SearchConfig, int, float, tictac::Turn>(),
             py::arg("config"),
             py::arg("iterations_per_move") = 0,
             py::arg("temperature") = 0.0f,
             py::arg("first_mover") = tictac::Turn::X,
             "Create a self-play game")
        .def("play_game", &tictac::selfplay::SelfPlayGame::play_game, "Play a full game",
             py::call_guard<py::gil_scoped_release>())
        .def("get_game_result", &tictac::selfplay::SelfPlayGame::get_game_result, "Get game result");

    // BatchGenerator
    py::class_<tictac::selfplay::BatchGenerator>(m, "BatchGenerator")
        .def(py::init<tictac::SearchConfig, int>(),
             py::arg("config"),
             py::arg("num_threads") = 8,
             "Create a parallel batch generator")
        .def("generate_batch", &tictac::selfplay::BatchGenerator::generate_batch,
             py::arg("num_games"),
             py::arg("iterations_per_move") = 0,
             py::arg("temperature") = 0.0f,
             "Play a batch of games in parallel",
             py::call_guard<py::gil_scoped_release>())
        .def("num_threads", &tictac::selfplay::BatchGenerator::num_threads,
             "Get number of threads");

    m.attr("__version__") = "0.4.0";
}
