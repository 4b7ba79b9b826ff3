/// @file attacks.cpp
/// Ray walking for sliders and the per-kind dispatch.

#include <arbiter/attacks.hpp>

namespace arbiter::attacks {

Bitboard ray(Square sq, Bitboard occupancy, int df, int dr) noexcept {
    Bitboard result = kEmptyBB;
    int f = file_of(sq) + df;
    int r = rank_of(sq) + dr;
    while (on_board(f, r)) {
        Square s = make_square(f, r);
        set_bit(result, s);
        if (test_bit(occupancy, s)) break;
        f += df;
        r += dr;
    }
    return result;
}

Bitboard bishop(Square sq, Bitboard occupancy) noexcept {
    return ray(sq, occupancy, 1, 1) | ray(sq, occupancy, 1, -1) | ray(sq, occupancy, -1, 1) |
           ray(sq, occupancy, -1, -1);
}

Bitboard rook(Square sq, Bitboard occupancy) noexcept {
    return ray(sq, occupancy, 1, 0) | ray(sq, occupancy, -1, 0) | ray(sq, occupancy, 0, 1) |
           ray(sq, occupancy, 0, -1);
}

Bitboard targets(PieceType pt, Color c, Square sq, const Board& board) noexcept {
    const Bitboard occ = board.occupied_all();
    switch (pt) {
        case PieceType::Pawn:
            return pawn_captures(c, sq);
        case PieceType::Knight:
            return knight_targets(sq);
        case PieceType::Bishop:
            return bishop(sq, occ);
        case PieceType::Rook:
            return rook(sq, occ);
        case PieceType::Queen:
            return queen(sq, occ);
        case PieceType::King:
            return king_targets(sq);
        case PieceType::None:
            break;
    }
    return kEmptyBB;
}

bool is_attacked(const Board& board, Square sq, Color by) noexcept {
    const Bitboard occ = board.occupied_all();

    // A pawn of `by` attacks `sq` iff it stands where a pawn of the other
    // color on `sq` would capture.
    if (pawn_captures(opposite(by), sq) & board.pieces(by, PieceType::Pawn)) return true;
    if (knight_targets(sq) & board.pieces(by, PieceType::Knight)) return true;
    if (king_targets(sq) & board.pieces(by, PieceType::King)) return true;

    const Bitboard queens = board.pieces(by, PieceType::Queen);
    if (bishop(sq, occ) & (board.pieces(by, PieceType::Bishop) | queens)) return true;
    if (rook(sq, occ) & (board.pieces(by, PieceType::Rook) | queens)) return true;

    return false;
}

}  // namespace arbiter::attacks
