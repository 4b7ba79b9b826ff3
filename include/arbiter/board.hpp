#pragma once

/// @file board.hpp
/// Fixed 8x8 board: a mailbox of optional pieces with per-kind bitboards kept in sync.

#include <arbiter/bitboard.hpp>
#include <arbiter/piece.hpp>
#include <arbiter/types.hpp>

#include <iosfwd>
#include <optional>
#include <ranges>
#include <string>

namespace arbiter {

/// One occupied square as yielded by Board::squares_with.
struct SquarePiece {
    Square square;
    Piece piece;

    [[nodiscard]] constexpr bool operator==(const SquarePiece&) const noexcept = default;
};

/// Board representation.
///
/// The 64-element mailbox answers "what is on this square"; the 12 piece
/// bitboards (2 colors x 6 kinds) and the occupancy sets answer "where are
/// the pieces of this kind". Every mutation updates both views.
class Board {
public:
    Board() noexcept { clear(); }

    // ── Queries ─────────────────────────────────────────────────────────

    [[nodiscard]] std::optional<Piece> get(Square sq) const noexcept {
        if (mailbox_[sq].type == PieceType::None) return std::nullopt;
        return mailbox_[sq];
    }

    /// Piece at a square (kNoPiece if empty).
    [[nodiscard]] Piece piece_at(Square sq) const noexcept { return mailbox_[sq]; }

    [[nodiscard]] bool is_empty(Square sq) const noexcept {
        return mailbox_[sq].type == PieceType::None;
    }

    [[nodiscard]] Bitboard pieces(Color c, PieceType pt) const noexcept {
        return pieces_[color_index(c)][piece_index(pt)];
    }

    [[nodiscard]] Bitboard occupied(Color c) const noexcept {
        return occupied_[color_index(c)];
    }

    [[nodiscard]] Bitboard occupied_all() const noexcept { return occupied_[0] | occupied_[1]; }

    [[nodiscard]] int count(Color c, PieceType pt) const noexcept {
        return popcount(pieces(c, pt));
    }

    /// Square of the king for a given color. The king must be on the board.
    [[nodiscard]] Square king_square(Color c) const noexcept {
        return lsb(pieces(c, PieceType::King));
    }

    /// Occupied squares whose piece satisfies `pred`, scanned a1 -> h8.
    ///
    /// The result is a lazy view: nothing is evaluated until it is iterated,
    /// and it can be iterated again. It refers to this board and must not
    /// outlive it.
    template <typename Pred>
    [[nodiscard]] auto squares_with(Pred pred) const {
        return std::views::iota(0, 64) | std::views::transform([this](int sq) {
                   return SquarePiece{static_cast<Square>(sq), mailbox_[sq]};
               }) |
               std::views::filter([pred](const SquarePiece& sp) {
                   return sp.piece.type != PieceType::None && pred(sp.piece);
               });
    }

    // ── Mutation ────────────────────────────────────────────────────────

    /// Replace whatever occupies `sq` with `p` (or empty it).
    void set(Square sq, std::optional<Piece> p) noexcept {
        if (!is_empty(sq)) remove_piece(sq);
        if (p && p->type != PieceType::None) put_piece(sq, *p);
    }

    /// Place a piece on an empty square.
    void put_piece(Square sq, Piece p) noexcept {
        int ci = color_index(p.color);
        set_bit(pieces_[ci][piece_index(p.type)], sq);
        set_bit(occupied_[ci], sq);
        mailbox_[sq] = p;
    }

    /// Remove the piece from an occupied square.
    void remove_piece(Square sq) noexcept {
        Piece p = mailbox_[sq];
        int ci = color_index(p.color);
        clear_bit(pieces_[ci][piece_index(p.type)], sq);
        clear_bit(occupied_[ci], sq);
        mailbox_[sq] = kNoPiece;
    }

    /// Move a piece from an occupied square to an empty one.
    void move_piece(Square from, Square to) noexcept {
        Piece p = mailbox_[from];
        remove_piece(from);
        put_piece(to, p);
    }

    void clear() noexcept;

    // ── Display ─────────────────────────────────────────────────────────

    /// 8x8 text grid, rank 8 at the top, '.' for empty squares.
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] bool operator==(const Board& other) const noexcept {
        for (int sq = 0; sq < 64; ++sq) {
            if (mailbox_[sq] != other.mailbox_[sq]) return false;
        }
        return true;
    }

    /// Standard starting position.
    [[nodiscard]] static Board initial() noexcept;

private:
    Bitboard pieces_[2][6]{};  // [color_index][piece_index]
    Bitboard occupied_[2]{};   // [color_index]
    Piece mailbox_[64]{};
};

std::ostream& operator<<(std::ostream& os, const Board& board);

}  // namespace arbiter
