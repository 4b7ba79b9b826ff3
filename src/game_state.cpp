/// @file game_state.cpp
/// GameState helpers and printable forms.

#include <arbiter/game_state.hpp>

#include <ostream>

namespace arbiter {

std::string_view to_string(DrawReason reason) noexcept {
    switch (reason) {
        case DrawReason::FiftyMove:
            return "fifty-move rule";
        case DrawReason::ThreefoldRepetition:
            return "threefold repetition";
        case DrawReason::InsufficientMaterial:
            return "insufficient material";
    }
    return "unknown";
}

bool is_over(const GameState& state) noexcept {
    return !std::holds_alternative<InProgress>(state) && !std::holds_alternative<Check>(state);
}

MoveList legal_moves(const GameState& state) noexcept {
    if (const auto* s = std::get_if<InProgress>(&state)) return s->legal_moves;
    if (const auto* s = std::get_if<Check>(&state)) return s->legal_moves;
    return {};
}

std::string to_string(const GameState& state) {
    struct Describe {
        std::string operator()(const InProgress& s) const {
            return "in progress (" + std::string(color_name(s.side_to_move)) + " to move)";
        }
        std::string operator()(const Check& s) const {
            return "check (" + std::string(color_name(s.side_to_move)) + " to move)";
        }
        std::string operator()(const Checkmate& s) const {
            return "checkmate (" + std::string(color_name(s.winner)) + " wins)";
        }
        std::string operator()(const Stalemate&) const { return "stalemate"; }
        std::string operator()(const Draw& s) const {
            return "draw (" + std::string(to_string(s.reason)) + ")";
        }
    };
    return std::visit(Describe{}, state);
}

std::ostream& operator<<(std::ostream& os, const GameState& state) {
    return os << to_string(state);
}

}  // namespace arbiter
