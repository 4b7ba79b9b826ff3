/// @file movegen.cpp
/// Move generation: per-kind targets from attacks::targets, pawn pushes,
/// promotions, en passant and castling, then the self-check filter.

#include <arbiter/movegen.hpp>

#include <arbiter/attacks.hpp>

namespace arbiter::movegen {

namespace {

constexpr PieceType kPromotions[] = {PieceType::Queen, PieceType::Rook, PieceType::Bishop,
                                     PieceType::Knight};

constexpr PieceType kPieceOrder[] = {PieceType::Knight, PieceType::Bishop, PieceType::Rook,
                                     PieceType::Queen, PieceType::King};

void add_pawn_move(MoveList& ml, Square from, Square to, Color us) {
    if (rank_of(to) == promotion_rank(us)) {
        for (PieceType pt : kPromotions) {
            ml.push({from, to, MoveFlag::Promotion, pt});
        }
    } else {
        ml.push({from, to});
    }
}

// ── Pawns ───────────────────────────────────────────────────────────────────

void gen_pawn_moves(const Position& pos, MoveList& ml) {
    const Color us = pos.side_to_move();
    const Board& board = pos.board();
    const Bitboard enemy = board.occupied(opposite(us));
    const int dir = pawn_direction(us);
    const int start_rank = home_rank(us) + dir;

    Bitboard pawns = board.pieces(us, PieceType::Pawn);
    while (pawns) {
        const Square from = pop_lsb(pawns);
        const int f = file_of(from);
        const int r = rank_of(from);

        // Pushes. A pawn is never on its promotion rank, so r + dir is on the board.
        const Square one = make_square(f, r + dir);
        if (board.is_empty(one)) {
            add_pawn_move(ml, from, one, us);
            if (r == start_rank) {
                const Square two = make_square(f, r + 2 * dir);
                if (board.is_empty(two)) {
                    ml.push({from, two, MoveFlag::DoublePawn});
                }
            }
        }

        // Captures
        const Bitboard diagonals = attacks::targets(PieceType::Pawn, us, from, board);
        Bitboard caps = diagonals & enemy;
        while (caps) {
            add_pawn_move(ml, from, pop_lsb(caps), us);
        }

        if (pos.en_passant() != kNoSquare && test_bit(diagonals, pos.en_passant())) {
            ml.push({from, pos.en_passant(), MoveFlag::EnPassant});
        }
    }
}

// ── Knight, bishop, rook, queen, king ───────────────────────────────────────

void gen_piece_moves(const Position& pos, MoveList& ml, PieceType pt) {
    const Color us = pos.side_to_move();
    const Board& board = pos.board();
    const Bitboard friendly = board.occupied(us);

    Bitboard pieces = board.pieces(us, pt);
    while (pieces) {
        const Square from = pop_lsb(pieces);
        Bitboard targets = attacks::targets(pt, us, from, board) & ~friendly;
        while (targets) {
            ml.push({from, pop_lsb(targets)});
        }
    }
}

// ── Castling ────────────────────────────────────────────────────────────────

/// King on e-file of its home rank, rook on `rook_file`, every square between
/// them empty, and none of the king's start, transit or landing squares attacked.
bool can_castle(const Position& pos, Color us, int rook_file) {
    const Board& board = pos.board();
    const Color them = opposite(us);
    const int rank = home_rank(us);

    if (board.piece_at(make_square(rook_file, rank)) != Piece{us, PieceType::Rook}) {
        return false;
    }

    const int step = (rook_file > 4) ? 1 : -1;
    for (int f = 4 + step; f != rook_file; f += step) {
        if (!board.is_empty(make_square(f, rank))) return false;
    }
    for (int f = 4; f != 4 + 3 * step; f += step) {
        if (pos.is_square_attacked(make_square(f, rank), them)) return false;
    }
    return true;
}

void gen_castling(const Position& pos, MoveList& ml) {
    const Color us = pos.side_to_move();
    const int rank = home_rank(us);
    const Square king_sq = make_square(4, rank);

    if (pos.board().piece_at(king_sq) != Piece{us, PieceType::King}) return;

    if ((pos.castling() & kingside_right(us)) && can_castle(pos, us, 7)) {
        ml.push({king_sq, make_square(6, rank), MoveFlag::CastleKingside});
    }
    if ((pos.castling() & queenside_right(us)) && can_castle(pos, us, 0)) {
        ml.push({king_sq, make_square(2, rank), MoveFlag::CastleQueenside});
    }
}

bool leaves_king_safe(const Position& pos, const Move& m) {
    Position scratch = pos;
    const Color us = pos.side_to_move();
    (void)scratch.make_move(m);
    return !scratch.is_in_check(us);
}

}  // anonymous namespace

// ── Public API ──────────────────────────────────────────────────────────────

MoveList pseudo_legal(const Position& pos) {
    MoveList ml;
    gen_pawn_moves(pos, ml);
    for (PieceType pt : kPieceOrder) {
        gen_piece_moves(pos, ml, pt);
    }
    gen_castling(pos, ml);
    return ml;
}

MoveList legal(const Position& pos) {
    MoveList result;
    for (const Move& m : pseudo_legal(pos)) {
        if (leaves_king_safe(pos, m)) {
            result.push(m);
        }
    }
    return result;
}

bool has_legal_move(const Position& pos) {
    for (const Move& m : pseudo_legal(pos)) {
        if (leaves_king_safe(pos, m)) return true;
    }
    return false;
}

std::uint64_t perft(const Position& pos, int depth) {
    if (depth == 0)
        return 1;

    MoveList moves = legal(pos);
    if (depth == 1)
        return static_cast<std::uint64_t>(moves.size());

    std::uint64_t nodes = 0;
    Position scratch = pos;
    for (const Move& m : moves) {
        HistoryEntry undo = scratch.make_move(m);
        nodes += perft(scratch, depth - 1);
        scratch.unmake_move(undo);
    }
    return nodes;
}

}  // namespace arbiter::movegen
