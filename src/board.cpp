/// @file board.cpp
/// Board implementation: starting layout and text grid.

#include <arbiter/board.hpp>

#include <ostream>

namespace arbiter {

void Board::clear() noexcept {
    for (auto& color_pieces : pieces_) {
        for (auto& bb : color_pieces) {
            bb = kEmptyBB;
        }
    }
    occupied_[0] = kEmptyBB;
    occupied_[1] = kEmptyBB;
    for (auto& p : mailbox_) {
        p = kNoPiece;
    }
}

Board Board::initial() noexcept {
    Board b;

    constexpr PieceType kBackRank[] = {
        PieceType::Rook, PieceType::Knight, PieceType::Bishop, PieceType::Queen,
        PieceType::King, PieceType::Bishop, PieceType::Knight, PieceType::Rook,
    };

    for (int f = 0; f < 8; ++f) {
        b.put_piece(make_square(f, 0), {Color::White, kBackRank[f]});
        b.put_piece(make_square(f, 1), {Color::White, PieceType::Pawn});
        b.put_piece(make_square(f, 6), {Color::Black, PieceType::Pawn});
        b.put_piece(make_square(f, 7), {Color::Black, kBackRank[f]});
    }

    return b;
}

std::string Board::to_string() const {
    std::string out;
    out.reserve(9 * 18);
    for (int rank = 7; rank >= 0; --rank) {
        out += static_cast<char>('1' + rank);
        for (int file = 0; file < 8; ++file) {
            out += ' ';
            out += mailbox_[make_square(file, rank)].fen_char();
        }
        out += '\n';
    }
    out += "  a b c d e f g h\n";
    return out;
}

std::ostream& operator<<(std::ostream& os, const Board& board) {
    return os << board.to_string();
}

}  // namespace arbiter
