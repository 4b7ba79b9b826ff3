/// @file game.cpp
/// Game state machine: commit, undo, redo and terminal-state derivation.

#include <arbiter/game.hpp>

#include <arbiter/errors.hpp>
#include <arbiter/movegen.hpp>

#include <algorithm>

namespace arbiter {

namespace {

RuleConfig sanitized(RuleConfig config) noexcept {
    config.fifty_move_halfmoves = std::max(config.fifty_move_halfmoves, 1);
    config.repetition_limit = std::max(config.repetition_limit, 1);
    return config;
}

const Position& validated(const Position& pos) {
    codec::validate(pos);
    return pos;
}

}  // anonymous namespace

// ── Construction ────────────────────────────────────────────────────────────

Game::Game(RuleConfig config) : Game(Position::initial(), config) {}

Game::Game(const Position& start, RuleConfig config)
    : config_(sanitized(config)), position_(validated(start)), key_(codec::encode(position_)) {
    repetitions_.increment(key_);
    refresh_state();
}

Game new_game(RuleConfig config) {
    return Game(config);
}

Game new_game_from_text(std::string_view record, RuleConfig config) {
    return Game(codec::parse_text(record), config);
}

// ── Transitions ─────────────────────────────────────────────────────────────

const GameState& Game::make_move(const Move& m) {
    if (is_over() || !legal_moves().contains(m)) {
        throw IllegalMove(m);
    }
    history_.clear_redo();
    commit(m);
    return state_;
}

const GameState& Game::undo() {
    if (history_.empty()) {
        throw NoHistory();
    }
    repetitions_.decrement(key_);
    const HistoryEntry entry = history_.pop();
    position_.unmake_move(entry);
    key_ = codec::encode(position_);
    history_.push_redo(entry.move);
    refresh_state();
    return state_;
}

const GameState& Game::redo() {
    if (!history_.can_redo()) {
        throw NoRedo();
    }
    // The redo stack only holds moves that were legal from the position
    // undo() returned to, and any fresh move clears it.
    commit(history_.pop_redo());
    return state_;
}

void Game::commit(const Move& m) {
    history_.record(position_.make_move(m));
    key_ = codec::encode(position_);
    repetitions_.increment(key_);
    refresh_state();
}

// ── State derivation ────────────────────────────────────────────────────────

void Game::refresh_state() {
    const Color us = position_.side_to_move();
    MoveList moves = movegen::legal(position_);

    if (moves.empty()) {
        if (position_.is_in_check()) {
            state_ = Checkmate{opposite(us)};
        } else {
            state_ = Stalemate{};
        }
        return;
    }

    if (position_.halfmove_clock() >= config_.fifty_move_halfmoves) {
        state_ = Draw{DrawReason::FiftyMove};
    } else if (is_insufficient_material(position_.board())) {
        state_ = Draw{DrawReason::InsufficientMaterial};
    } else if (repetitions_.count(key_) >= config_.repetition_limit) {
        state_ = Draw{DrawReason::ThreefoldRepetition};
    } else if (position_.is_in_check()) {
        state_ = Check{moves, us};
    } else {
        state_ = InProgress{moves, us};
    }
}

// ── Queries ─────────────────────────────────────────────────────────────────

std::optional<Move> Game::find_move(Square from, Square to, PieceType promotion) const {
    for (const Move& m : legal_moves()) {
        if (m.from_sq == from && m.to_sq == to && m.promotion == promotion) {
            return m;
        }
    }
    return std::nullopt;
}

bool is_insufficient_material(const Board& board) noexcept {
    Bitboard bishops = kEmptyBB;
    int knights = 0;
    for (Color c : {Color::White, Color::Black}) {
        if (board.pieces(c, PieceType::Pawn) || board.pieces(c, PieceType::Rook) ||
            board.pieces(c, PieceType::Queen)) {
            return false;
        }
        bishops |= board.pieces(c, PieceType::Bishop);
        knights += board.count(c, PieceType::Knight);
    }

    const int minors = knights + popcount(bishops);
    if (minors <= 1) return true;
    if (knights > 0) return false;
    // Bishops only: dead when none of them can ever reach the other square color.
    return (bishops & kDarkSquares) == 0 || (bishops & kLightSquares) == 0;
}

}  // namespace arbiter
