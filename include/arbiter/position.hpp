#pragma once

/// @file position.hpp
/// Complete chess position: board + side-to-move + castling + en passant + clocks.
///
/// A Position is a plain value. make_move returns the HistoryEntry that
/// reverses it, so the caller decides where the undo information lives.

#include <arbiter/board.hpp>
#include <arbiter/history.hpp>
#include <arbiter/move.hpp>

#include <array>
#include <string_view>

namespace arbiter {

inline constexpr std::string_view kStartingFen =
    "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

// ── Castling rights update table ────────────────────────────────────────────
/// For each square, the castling rights to PRESERVE when a move starts or ends
/// there. Usage: `castling &= kCastleMask[from] & kCastleMask[to]`

namespace detail {

constexpr CastlingRights castling_mask_for(int sq) noexcept {
    switch (sq) {
        case A1:
            return kCastlingAll & ~kWhiteQueenside;
        case H1:
            return kCastlingAll & ~kWhiteKingside;
        case E1:
            return kCastlingAll & ~kWhiteBoth;
        case A8:
            return kCastlingAll & ~kBlackQueenside;
        case H8:
            return kCastlingAll & ~kBlackKingside;
        case E8:
            return kCastlingAll & ~kBlackBoth;
        default:
            return kCastlingAll;
    }
}

constexpr auto make_castling_masks() noexcept {
    std::array<CastlingRights, 64> masks{};
    for (int i = 0; i < 64; ++i) {
        masks[i] = castling_mask_for(i);
    }
    return masks;
}

inline constexpr auto kCastleMask = make_castling_masks();

}  // namespace detail

// ── Position ────────────────────────────────────────────────────────────────

class Position {
   public:
    Position(Board board, Color side, CastlingRights castling, Square ep, int halfmove,
             int fullmove);

    /// Empty board, white to move, no castling, no en passant.
    Position() = default;

    /// Standard starting position.
    [[nodiscard]] static Position initial();

    // ── Move operations ─────────────────────────────────────────────────

    /// Apply a move and return what is needed to take it back.
    /// The move must be pseudo-legal in this position.
    HistoryEntry make_move(const Move& m);

    /// Reverse the move recorded in `entry`, which must be the last one applied.
    void unmake_move(const HistoryEntry& entry);

    // ── Accessors ───────────────────────────────────────────────────────

    [[nodiscard]] const Board& board() const noexcept { return board_; }
    [[nodiscard]] Color side_to_move() const noexcept { return side_to_move_; }
    [[nodiscard]] CastlingRights castling() const noexcept { return castling_; }
    [[nodiscard]] Square en_passant() const noexcept { return en_passant_; }
    [[nodiscard]] int halfmove_clock() const noexcept { return halfmove_clock_; }
    [[nodiscard]] int fullmove_number() const noexcept { return fullmove_number_; }

    // ── Attack queries ──────────────────────────────────────────────────

    /// Is `sq` attacked by any piece of color `by`?
    [[nodiscard]] bool is_square_attacked(Square sq, Color by) const noexcept;

    /// Is the side-to-move's king in check?
    [[nodiscard]] bool is_in_check() const noexcept;

    /// Is the specified color's king in check?
    [[nodiscard]] bool is_in_check(Color c) const noexcept;

    /// Same board, side, castling rights and en-passant target. Clocks are ignored.
    [[nodiscard]] bool same_placement(const Position& other) const noexcept {
        return board_ == other.board_ && side_to_move_ == other.side_to_move_ &&
               castling_ == other.castling_ && en_passant_ == other.en_passant_;
    }

    [[nodiscard]] bool operator==(const Position& other) const noexcept {
        return same_placement(other) && halfmove_clock_ == other.halfmove_clock_ &&
               fullmove_number_ == other.fullmove_number_;
    }

   private:
    Board board_;
    Color side_to_move_ = Color::White;
    CastlingRights castling_ = kCastlingNone;
    Square en_passant_ = kNoSquare;
    int halfmove_clock_ = 0;
    int fullmove_number_ = 1;
};

}  // namespace arbiter
