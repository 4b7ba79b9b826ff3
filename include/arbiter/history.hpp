#pragma once

/// @file history.hpp
/// Applied-move log with a redo stack.

#include <arbiter/move.hpp>
#include <arbiter/piece.hpp>
#include <arbiter/types.hpp>

#include <optional>
#include <span>
#include <vector>

namespace arbiter {

/// Everything needed to reverse one applied move exactly.
struct HistoryEntry {
    Move move;
    Piece captured = kNoPiece;  ///< kNoPiece if nothing was captured
    CastlingRights castling = kCastlingNone;
    Square en_passant = kNoSquare;
    int halfmove_clock = 0;
    int fullmove_number = 1;
};

/// Ordered sequence of applied moves plus the moves taken back by undo.
///
/// Entries are appended on make-move and popped on undo. The redo stack holds
/// undone moves, most recent on top; it is cleared when a fresh move is made.
class HistoryLog {
   public:
    void record(const HistoryEntry& entry) { entries_.push_back(entry); }

    /// Remove and return the most recent entry. The log must not be empty.
    HistoryEntry pop();

    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] std::span<const HistoryEntry> entries() const noexcept { return entries_; }
    [[nodiscard]] std::optional<Move> last_move() const noexcept;
    [[nodiscard]] std::vector<Move> moves() const;

    // ── Redo stack ──────────────────────────────────────────────────────

    void push_redo(const Move& m) { redo_.push_back(m); }

    /// Remove and return the most recently undone move. The stack must not be empty.
    Move pop_redo();

    void clear_redo() noexcept { redo_.clear(); }
    [[nodiscard]] bool can_redo() const noexcept { return !redo_.empty(); }
    [[nodiscard]] std::size_t redo_size() const noexcept { return redo_.size(); }

    void clear() noexcept {
        entries_.clear();
        redo_.clear();
    }

   private:
    std::vector<HistoryEntry> entries_;
    std::vector<Move> redo_;
};

}  // namespace arbiter
