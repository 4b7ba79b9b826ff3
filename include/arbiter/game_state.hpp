#pragma once

/// @file game_state.hpp
/// Outcome of the position on the board after the last committed move.

#include <arbiter/move.hpp>
#include <arbiter/types.hpp>

#include <iosfwd>
#include <string>
#include <string_view>
#include <variant>

namespace arbiter {

enum class DrawReason : std::uint8_t {
    FiftyMove,
    ThreefoldRepetition,
    InsufficientMaterial,
};

[[nodiscard]] std::string_view to_string(DrawReason reason) noexcept;

/// Game continues; the side to move is not in check.
struct InProgress {
    MoveList legal_moves;
    Color side_to_move;
};

/// Game continues; the side to move is in check.
struct Check {
    MoveList legal_moves;
    Color side_to_move;
};

struct Checkmate {
    Color winner;
};

struct Stalemate {};

struct Draw {
    DrawReason reason;
};

using GameState = std::variant<InProgress, Check, Checkmate, Stalemate, Draw>;

/// True for Checkmate, Stalemate and Draw.
[[nodiscard]] bool is_over(const GameState& state) noexcept;

/// Legal moves carried by InProgress/Check; empty once the game is over.
[[nodiscard]] MoveList legal_moves(const GameState& state) noexcept;

/// e.g. "in progress (white to move)", "checkmate (black wins)", "draw (fifty-move rule)".
[[nodiscard]] std::string to_string(const GameState& state);

std::ostream& operator<<(std::ostream& os, const GameState& state);

}  // namespace arbiter
