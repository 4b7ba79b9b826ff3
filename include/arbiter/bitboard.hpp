#pragma once

/// @file bitboard.hpp
/// 64-bit square sets and the fixed-offset target tables for knights, kings and
/// pawn captures.

#include <arbiter/types.hpp>

#include <bit>
#include <cstdint>
#include <initializer_list>

namespace arbiter {

using Bitboard = std::uint64_t;

inline constexpr Bitboard kEmptyBB = 0ULL;

// ── Bit manipulation ────────────────────────────────────────────────────────

[[nodiscard]] constexpr Bitboard square_bb(Square sq) noexcept {
    return 1ULL << sq;
}

[[nodiscard]] constexpr int popcount(Bitboard b) noexcept {
    return std::popcount(b);
}

/// Index of the least significant set bit. `b` must be non-empty.
[[nodiscard]] constexpr Square lsb(Bitboard b) noexcept {
    return static_cast<Square>(std::countr_zero(b));
}

/// Pop (return and clear) the least significant bit.
[[nodiscard]] constexpr Square pop_lsb(Bitboard& b) noexcept {
    Square sq = lsb(b);
    b &= b - 1;
    return sq;
}

[[nodiscard]] constexpr bool test_bit(Bitboard b, Square sq) noexcept {
    return (b >> sq) & 1;
}

constexpr void set_bit(Bitboard& b, Square sq) noexcept {
    b |= square_bb(sq);
}

constexpr void clear_bit(Bitboard& b, Square sq) noexcept {
    b &= ~square_bb(sq);
}

// ── Square-color masks ──────────────────────────────────────────────────────

inline constexpr Bitboard kDarkSquares = 0xAA55AA55AA55AA55ULL;
inline constexpr Bitboard kLightSquares = ~kDarkSquares;

// ── Fixed-offset tables ─────────────────────────────────────────────────────

namespace detail {

struct Offset {
    int df;
    int dr;
};

inline constexpr Offset kKnightOffsets[] = {{1, 2},  {2, 1},  {2, -1}, {1, -2},
                                            {-1, -2}, {-2, -1}, {-2, 1}, {-1, 2}};
inline constexpr Offset kKingOffsets[] = {{0, 1},  {1, 1},   {1, 0},  {1, -1},
                                          {0, -1}, {-1, -1}, {-1, 0}, {-1, 1}};

struct SquareTable {
    Bitboard table[64]{};
};

/// Every on-board square reachable from each origin by one of `offsets`.
template <int N>
constexpr SquareTable offset_table(const Offset (&offsets)[N]) noexcept {
    SquareTable t{};
    for (int sq = 0; sq < 64; ++sq) {
        int f = sq & 7;
        int r = sq >> 3;
        for (const Offset& o : offsets) {
            if (on_board(f + o.df, r + o.dr)) {
                t.table[sq] |= square_bb(make_square(f + o.df, r + o.dr));
            }
        }
    }
    return t;
}

struct PawnTable {
    Bitboard table[2][64]{};
};

constexpr PawnTable pawn_capture_table() noexcept {
    PawnTable t{};
    for (int c = 0; c < 2; ++c) {
        const int dr = pawn_direction(static_cast<Color>(c));
        for (int sq = 0; sq < 64; ++sq) {
            int f = sq & 7;
            int r = sq >> 3;
            for (int df : {-1, 1}) {
                if (on_board(f + df, r + dr)) {
                    t.table[c][sq] |= square_bb(make_square(f + df, r + dr));
                }
            }
        }
    }
    return t;
}

inline constexpr SquareTable kKnightTargets = offset_table(kKnightOffsets);
inline constexpr SquareTable kKingTargets = offset_table(kKingOffsets);
inline constexpr PawnTable kPawnCaptures = pawn_capture_table();

}  // namespace detail

[[nodiscard]] constexpr Bitboard knight_targets(Square sq) noexcept {
    return detail::kKnightTargets.table[sq];
}

[[nodiscard]] constexpr Bitboard king_targets(Square sq) noexcept {
    return detail::kKingTargets.table[sq];
}

/// Squares a pawn of color `c` standing on `sq` captures on.
[[nodiscard]] constexpr Bitboard pawn_captures(Color c, Square sq) noexcept {
    return detail::kPawnCaptures.table[color_index(c)][sq];
}

}  // namespace arbiter
