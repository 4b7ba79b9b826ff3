#pragma once

/// @file piece.hpp
/// Piece value object (color + kind).

#include <arbiter/types.hpp>

#include <optional>
#include <string_view>

namespace arbiter {

/// An immutable piece (color + kind). `PieceType::None` marks an empty square.
struct Piece {
    Color color;
    PieceType type;

    [[nodiscard]] constexpr bool operator==(const Piece&) const noexcept = default;

    /// FEN character for this piece ('P','N','B','R','Q','K' for white, lowercase for black).
    [[nodiscard]] constexpr char fen_char() const noexcept {
        // clang-format off
        constexpr char kChars[2][7] = {
            {'.', 'P', 'N', 'B', 'R', 'Q', 'K'},
            {'.', 'p', 'n', 'b', 'r', 'q', 'k'},
        };
        // clang-format on
        return kChars[color_index(color)][static_cast<int>(type)];
    }

    /// Parse a FEN piece character.
    [[nodiscard]] static constexpr std::optional<Piece> from_fen_char(char ch) noexcept {
        switch (ch) {
                // clang-format off
            case 'P': return Piece{Color::White, PieceType::Pawn};
            case 'N': return Piece{Color::White, PieceType::Knight};
            case 'B': return Piece{Color::White, PieceType::Bishop};
            case 'R': return Piece{Color::White, PieceType::Rook};
            case 'Q': return Piece{Color::White, PieceType::Queen};
            case 'K': return Piece{Color::White, PieceType::King};
            case 'p': return Piece{Color::Black, PieceType::Pawn};
            case 'n': return Piece{Color::Black, PieceType::Knight};
            case 'b': return Piece{Color::Black, PieceType::Bishop};
            case 'r': return Piece{Color::Black, PieceType::Rook};
            case 'q': return Piece{Color::Black, PieceType::Queen};
            case 'k': return Piece{Color::Black, PieceType::King};
            default:  return std::nullopt;
                // clang-format on
        }
    }
};

/// Sentinel stored in empty mailbox slots.
inline constexpr Piece kNoPiece{Color::White, PieceType::None};

/// Promotion kind from its letter ("q", "R", ...). An empty string means no
/// promotion. Anything else, including longer strings, is rejected.
[[nodiscard]] constexpr std::optional<PieceType> parse_promotion(std::string_view s) noexcept {
    if (s.empty()) return PieceType::None;
    if (s.size() != 1) return std::nullopt;
    switch (s.front()) {
        // clang-format off
        case 'q': case 'Q': return PieceType::Queen;
        case 'r': case 'R': return PieceType::Rook;
        case 'b': case 'B': return PieceType::Bishop;
        case 'n': case 'N': return PieceType::Knight;
        default:            return std::nullopt;
        // clang-format on
    }
}

}  // namespace arbiter
