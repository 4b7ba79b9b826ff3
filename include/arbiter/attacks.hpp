#pragma once

/// @file attacks.hpp
/// Movement rules per piece kind, as pure functions of (kind, color, square, board).

#include <arbiter/bitboard.hpp>
#include <arbiter/board.hpp>
#include <arbiter/types.hpp>

namespace arbiter::attacks {

/// Squares reached by sliding from `sq` along (df, dr) until the first occupied
/// square, which is included.
[[nodiscard]] Bitboard ray(Square sq, Bitboard occupancy, int df, int dr) noexcept;

[[nodiscard]] Bitboard bishop(Square sq, Bitboard occupancy) noexcept;
[[nodiscard]] Bitboard rook(Square sq, Bitboard occupancy) noexcept;
[[nodiscard]] inline Bitboard queen(Square sq, Bitboard occupancy) noexcept {
    return bishop(sq, occupancy) | rook(sq, occupancy);
}

/// Squares a piece of kind `pt` and color `c` on `sq` attacks on `board`.
///
/// Own-occupied squares are included; callers that generate moves mask them
/// out. For pawns this is the two capture diagonals only: pushes are not
/// attacks and are produced by the move generator.
[[nodiscard]] Bitboard targets(PieceType pt, Color c, Square sq, const Board& board) noexcept;

/// Is `sq` attacked by any piece of color `by`?
[[nodiscard]] bool is_attacked(const Board& board, Square sq, Color by) noexcept;

}  // namespace arbiter::attacks
