#pragma once

/// @file errors.hpp
/// Exception types thrown by the rules engine. Every one of them is
/// recoverable: the object that threw is left exactly as it was.

#include <arbiter/move.hpp>

#include <stdexcept>
#include <string>
#include <string_view>

namespace arbiter {

/// The move is not in the current legal set, or the game is already over.
class IllegalMove : public std::invalid_argument {
   public:
    explicit IllegalMove(const Move& m)
        : std::invalid_argument("illegal move: " + m.uci()), move_(m) {}

    [[nodiscard]] const Move& move() const noexcept { return move_; }

   private:
    Move move_;
};

/// undo() with nothing to undo.
class NoHistory : public std::out_of_range {
   public:
    NoHistory() : std::out_of_range("no move to undo") {}
};

/// redo() with nothing to redo.
class NoRedo : public std::out_of_range {
   public:
    NoRedo() : std::out_of_range("no move to redo") {}
};

/// Which part of a serialized position failed to parse.
enum class RecordField {
    Layout,          ///< wrong number of fields
    Placement,
    SideToMove,
    Castling,
    EnPassant,
    HalfmoveClock,
    FullmoveNumber,
    Key,             ///< binary position key
};

[[nodiscard]] std::string_view to_string(RecordField field) noexcept;

/// A FEN record or position key could not be decoded.
class MalformedRecord : public std::invalid_argument {
   public:
    MalformedRecord(RecordField field, const std::string& reason)
        : std::invalid_argument(std::string(to_string(field)) + ": " + reason),
          field_(field),
          reason_(reason) {}

    [[nodiscard]] RecordField field() const noexcept { return field_; }
    [[nodiscard]] const std::string& reason() const noexcept { return reason_; }

   private:
    RecordField field_;
    std::string reason_;
};

}  // namespace arbiter
