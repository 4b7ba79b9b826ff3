#pragma once

/// @file config.hpp
/// Tunable thresholds for the automatic draw rules.

namespace arbiter {

struct RuleConfig {
    int fifty_move_halfmoves = 100;  ///< Half-moves without a pawn move or capture.
    int repetition_limit = 3;        ///< Occurrences of one position that end the game.
};

}  // namespace arbiter
