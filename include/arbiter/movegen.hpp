#pragma once

/// @file movegen.hpp
/// Pseudo-legal and legal move generation + perft.

#include <arbiter/position.hpp>

#include <cstdint>

namespace arbiter::movegen {

/// Moves that obey piece geometry for the side to move, ignoring whether
/// they leave the mover's own king attacked. Castling is included only when
/// the rights, the empty path and the unattacked king path all allow it.
[[nodiscard]] MoveList pseudo_legal(const Position& pos);

/// Pseudo-legal moves that do not leave the mover's king in check.
/// Each candidate is tried on a scratch copy; `pos` is never modified.
[[nodiscard]] MoveList legal(const Position& pos);

/// Whether the side to move has at least one legal move.
[[nodiscard]] bool has_legal_move(const Position& pos);

/// Count leaf nodes at `depth` plies.
[[nodiscard]] std::uint64_t perft(const Position& pos, int depth);

}  // namespace arbiter::movegen
