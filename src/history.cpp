/// @file history.cpp
/// HistoryLog implementation.

#include <arbiter/history.hpp>

namespace arbiter {

HistoryEntry HistoryLog::pop() {
    HistoryEntry entry = entries_.back();
    entries_.pop_back();
    return entry;
}

std::optional<Move> HistoryLog::last_move() const noexcept {
    if (entries_.empty()) return std::nullopt;
    return entries_.back().move;
}

std::vector<Move> HistoryLog::moves() const {
    std::vector<Move> out;
    out.reserve(entries_.size());
    for (const HistoryEntry& e : entries_) {
        out.push_back(e.move);
    }
    return out;
}

Move HistoryLog::pop_redo() {
    Move m = redo_.back();
    redo_.pop_back();
    return m;
}

}  // namespace arbiter
