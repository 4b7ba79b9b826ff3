#pragma once

/// @file game.hpp
/// Game state machine: the only owner allowed to mutate a board.
///
/// A Game holds the current Position, the history of applied moves with a redo
/// stack, and the repetition counts of every committed position. All mutation
/// goes through make_move / undo / redo, each of which re-derives the GameState
/// before returning. Instances share nothing, so independent games may live on
/// different threads.

#include <arbiter/codec.hpp>
#include <arbiter/config.hpp>
#include <arbiter/game_state.hpp>
#include <arbiter/history.hpp>
#include <arbiter/position.hpp>
#include <arbiter/repetition.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace arbiter {

class Game {
   public:
    /// Standard starting position.
    explicit Game(RuleConfig config = {});

    /// Start from an arbitrary position (e.g. one returned by codec::parse_text).
    /// Throws MalformedRecord if `start` fails codec::validate.
    explicit Game(const Position& start, RuleConfig config = {});

    // ── Transitions ─────────────────────────────────────────────────────

    /// Play `m`. Throws IllegalMove, leaving the game untouched, if the game
    /// is over or `m` is not one of the current legal moves.
    const GameState& make_move(const Move& m);

    /// Take back the last move. Throws NoHistory if nothing has been played.
    const GameState& undo();

    /// Replay the most recently undone move. Throws NoRedo if there is none.
    const GameState& redo();

    // ── Queries ─────────────────────────────────────────────────────────

    [[nodiscard]] const GameState& get_game_state() const noexcept { return state_; }
    [[nodiscard]] bool is_over() const noexcept { return arbiter::is_over(state_); }
    [[nodiscard]] MoveList legal_moves() const noexcept { return arbiter::legal_moves(state_); }

    /// Legal move with these squares (and promotion kind), if there is one.
    [[nodiscard]] std::optional<Move> find_move(Square from, Square to,
                                                PieceType promotion = PieceType::None) const;

    [[nodiscard]] const Position& position() const noexcept { return position_; }
    [[nodiscard]] const Board& get_board() const noexcept { return position_.board(); }
    [[nodiscard]] Color side_to_move() const noexcept { return position_.side_to_move(); }
    [[nodiscard]] CastlingRights castling_rights() const noexcept { return position_.castling(); }
    [[nodiscard]] Square en_passant() const noexcept { return position_.en_passant(); }
    [[nodiscard]] int halfmove_clock() const noexcept { return position_.halfmove_clock(); }
    [[nodiscard]] int fullmove_number() const noexcept { return position_.fullmove_number(); }

    [[nodiscard]] const HistoryLog& history() const noexcept { return history_; }
    [[nodiscard]] std::vector<Move> moves() const { return history_.moves(); }
    [[nodiscard]] std::optional<Move> last_move() const noexcept { return history_.last_move(); }
    [[nodiscard]] bool can_undo() const noexcept { return !history_.empty(); }
    [[nodiscard]] bool can_redo() const noexcept { return history_.can_redo(); }

    [[nodiscard]] const RepetitionTable& repetition_table() const noexcept { return repetitions_; }
    /// Occurrences of the current position so far, this one included.
    [[nodiscard]] int repetitions() const { return repetitions_.count(key_); }
    [[nodiscard]] const PositionKey& key() const noexcept { return key_; }

    [[nodiscard]] const RuleConfig& config() const noexcept { return config_; }

    /// Current position as a FEN record.
    [[nodiscard]] std::string to_text() const { return codec::to_text(position_); }

   private:
    void commit(const Move& m);
    void refresh_state();

    RuleConfig config_;
    Position position_;
    PositionKey key_;
    HistoryLog history_;
    RepetitionTable repetitions_;
    GameState state_;
};

/// Game from the standard starting position.
[[nodiscard]] Game new_game(RuleConfig config = {});

/// Game from a FEN record. Throws MalformedRecord on invalid input.
[[nodiscard]] Game new_game_from_text(std::string_view record, RuleConfig config = {});

/// Dead positions recognised without search: K v K, K + one minor v K, and
/// positions whose only non-king pieces are bishops all on one square color.
[[nodiscard]] bool is_insufficient_material(const Board& board) noexcept;

}  // namespace arbiter
