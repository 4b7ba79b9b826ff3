/// @file pybind_module.cpp
/// pybind11 bindings for the arbiter rules engine.
///
/// Exposes the `_arbiter` Python module with a `Game` class.
/// Positions cross the boundary as FEN strings and moves as coordinate
/// strings ("e2e4", "e7e8q"), so Python never sees C++ value types.

#include <arbiter/errors.hpp>
#include <arbiter/game.hpp>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <string>
#include <vector>

namespace py = pybind11;

namespace {

arbiter::PieceType promotion_from_string(const std::string& s) {
    auto kind = arbiter::parse_promotion(s);
    if (!kind) throw py::value_error("unknown promotion piece: " + s);
    return *kind;
}

arbiter::Square square_from_string(const std::string& s) {
    auto sq = arbiter::parse_square(s);
    if (!sq) throw py::value_error("invalid square: " + s);
    return *sq;
}

std::vector<std::string> move_strings(const arbiter::MoveList& moves) {
    std::vector<std::string> out;
    out.reserve(static_cast<std::size_t>(moves.size()));
    for (const arbiter::Move& m : moves) {
        out.push_back(m.uci());
    }
    return out;
}

}  // namespace

PYBIND11_MODULE(_arbiter, m) {
    m.doc() = "Native C++ chess rules engine (pybind11)";

    py::register_exception<arbiter::IllegalMove>(m, "IllegalMove", PyExc_ValueError);
    py::register_exception<arbiter::MalformedRecord>(m, "MalformedRecord", PyExc_ValueError);
    py::register_exception<arbiter::NoHistory>(m, "NoHistory", PyExc_IndexError);
    py::register_exception<arbiter::NoRedo>(m, "NoRedo", PyExc_IndexError);

    // ── Game class ──────────────────────────────────────────────────────
    py::class_<arbiter::Game>(m, "Game")
        .def(py::init([] { return arbiter::new_game(); }),
             "Start a game from the standard initial position.")

        .def_static(
            "from_text",
            [](const std::string& fen) { return arbiter::new_game_from_text(fen); },
            py::arg("fen"), "Start a game from a FEN record (raises MalformedRecord).")

        .def(
            "legal_moves",
            [](const arbiter::Game& self) { return move_strings(self.legal_moves()); },
            "Legal moves in coordinate form; empty once the game is over.")

        .def(
            "make_move",
            [](arbiter::Game& self, const std::string& from, const std::string& to,
               const std::string& promotion) {
                const arbiter::Square f = square_from_string(from);
                const arbiter::Square t = square_from_string(to);
                const arbiter::PieceType promo = promotion_from_string(promotion);
                auto mv = self.find_move(f, t, promo);
                if (!mv) {
                    throw arbiter::IllegalMove(arbiter::Move{f, t, arbiter::MoveFlag::Normal, promo});
                }
                return arbiter::to_string(self.make_move(*mv));
            },
            py::arg("from_sq"), py::arg("to_sq"), py::arg("promotion") = "",
            R"doc(Play the move *from_sq* -> *to_sq* and return the new state description.

Raises IllegalMove if it is not legal or the game is over.)doc")

        .def(
            "undo", [](arbiter::Game& self) { return arbiter::to_string(self.undo()); },
            "Take back the last move (raises NoHistory).")

        .def(
            "redo", [](arbiter::Game& self) { return arbiter::to_string(self.redo()); },
            "Replay the last undone move (raises NoRedo).")

        .def("to_text", &arbiter::Game::to_text, "Current position as a FEN record.")

        .def(
            "board", [](const arbiter::Game& self) { return self.get_board().to_string(); },
            "Text grid of the board, rank 8 first.")

        .def(
            "state",
            [](const arbiter::Game& self) { return arbiter::to_string(self.get_game_state()); },
            "Description of the current game state.")

        .def("is_over", &arbiter::Game::is_over)

        .def(
            "moves",
            [](const arbiter::Game& self) {
                std::vector<std::string> out;
                for (const arbiter::Move& mv : self.moves()) {
                    out.push_back(mv.uci());
                }
                return out;
            },
            "Moves played so far, oldest first.");
}
