/// @file position.cpp
/// Position implementation: make/unmake and attack queries.

#include <arbiter/position.hpp>

#include <arbiter/attacks.hpp>

namespace arbiter {

namespace {

/// Square of the pawn removed by an en-passant capture landing on `to`.
constexpr Square en_passant_victim(const Move& m) noexcept {
    return make_square(file_of(m.to_sq), rank_of(m.from_sq));
}

struct RookHop {
    Square from;
    Square to;
};

constexpr RookHop castling_rook(const Move& m) noexcept {
    const int r = rank_of(m.from_sq);
    if (m.flag == MoveFlag::CastleKingside) {
        return {make_square(7, r), make_square(5, r)};
    }
    return {make_square(0, r), make_square(3, r)};
}

}  // namespace

Position::Position(Board board, Color side, CastlingRights castling, Square ep, int halfmove,
                   int fullmove)
    : board_(board),
      side_to_move_(side),
      castling_(castling),
      en_passant_(ep),
      halfmove_clock_(halfmove),
      fullmove_number_(fullmove) {}

Position Position::initial() {
    return Position(Board::initial(), Color::White, kCastlingAll, kNoSquare, 0, 1);
}

// ── Move operations ─────────────────────────────────────────────────────────

HistoryEntry Position::make_move(const Move& m) {
    const Piece piece = board_.piece_at(m.from_sq);
    const Square capture_sq = m.is_en_passant() ? en_passant_victim(m) : m.to_sq;
    const Piece captured = board_.piece_at(capture_sq);

    HistoryEntry entry{m, captured, castling_, en_passant_, halfmove_clock_, fullmove_number_};

    if (captured != kNoPiece) {
        board_.remove_piece(capture_sq);
    }

    board_.remove_piece(m.from_sq);
    board_.put_piece(m.to_sq, m.is_promotion() ? Piece{piece.color, m.promotion} : piece);

    if (m.is_castle()) {
        RookHop hop = castling_rook(m);
        board_.move_piece(hop.from, hop.to);
    }

    en_passant_ = kNoSquare;
    if (m.flag == MoveFlag::DoublePawn) {
        en_passant_ =
            make_square(file_of(m.from_sq), (rank_of(m.from_sq) + rank_of(m.to_sq)) / 2);
    }

    castling_ &= detail::kCastleMask[m.from_sq] & detail::kCastleMask[m.to_sq];

    if (piece.type == PieceType::Pawn || captured != kNoPiece) {
        halfmove_clock_ = 0;
    } else {
        ++halfmove_clock_;
    }
    if (side_to_move_ == Color::Black) {
        ++fullmove_number_;
    }
    side_to_move_ = opposite(side_to_move_);

    return entry;
}

void Position::unmake_move(const HistoryEntry& entry) {
    const Move& m = entry.move;
    side_to_move_ = opposite(side_to_move_);

    if (m.is_castle()) {
        RookHop hop = castling_rook(m);
        board_.move_piece(hop.to, hop.from);
    }

    Piece placed = board_.piece_at(m.to_sq);
    board_.remove_piece(m.to_sq);
    board_.put_piece(m.from_sq, m.is_promotion() ? Piece{placed.color, PieceType::Pawn} : placed);

    if (entry.captured != kNoPiece) {
        board_.put_piece(m.is_en_passant() ? en_passant_victim(m) : m.to_sq, entry.captured);
    }

    castling_ = entry.castling;
    en_passant_ = entry.en_passant;
    halfmove_clock_ = entry.halfmove_clock;
    fullmove_number_ = entry.fullmove_number;
}

// ── Attack queries ──────────────────────────────────────────────────────────

bool Position::is_square_attacked(Square sq, Color by) const noexcept {
    return attacks::is_attacked(board_, sq, by);
}

bool Position::is_in_check() const noexcept {
    return is_in_check(side_to_move_);
}

bool Position::is_in_check(Color c) const noexcept {
    return is_square_attacked(board_.king_square(c), opposite(c));
}

}  // namespace arbiter
