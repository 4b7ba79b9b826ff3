#pragma once

/// @file types.hpp
/// Core value types shared by every rules module: squares, colors, piece kinds,
/// move categories and castling rights.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace arbiter {

// ── Square ──────────────────────────────────────────────────────────────────
// Little-Endian Rank-File: a1=0, b1=1, ..., h1=7, a2=8, ..., h8=63
using Square = std::uint8_t;

/// Sentinel used only for an absent en-passant target.
inline constexpr Square kNoSquare = 64;

[[nodiscard]] constexpr int file_of(Square sq) noexcept {
    return sq & 7;
}
[[nodiscard]] constexpr int rank_of(Square sq) noexcept {
    return sq >> 3;
}
[[nodiscard]] constexpr Square make_square(int file, int rank) noexcept {
    return static_cast<Square>(rank * 8 + file);
}
[[nodiscard]] constexpr bool on_board(int file, int rank) noexcept {
    return file >= 0 && file < 8 && rank >= 0 && rank < 8;
}

[[nodiscard]] inline std::string square_name(Square sq) {
    return {static_cast<char>('a' + file_of(sq)), static_cast<char>('1' + rank_of(sq))};
}

/// Parse "e4"-style names. Anything off the board is rejected.
[[nodiscard]] inline std::optional<Square> parse_square(std::string_view name) {
    if (name.size() != 2)
        return std::nullopt;
    int f = name[0] - 'a';
    int r = name[1] - '1';
    if (!on_board(f, r))
        return std::nullopt;
    return make_square(f, r);
}

// clang-format off
enum SquareConstants : Square {
    A1, B1, C1, D1, E1, F1, G1, H1,
    A2, B2, C2, D2, E2, F2, G2, H2,
    A3, B3, C3, D3, E3, F3, G3, H3,
    A4, B4, C4, D4, E4, F4, G4, H4,
    A5, B5, C5, D5, E5, F5, G5, H5,
    A6, B6, C6, D6, E6, F6, G6, H6,
    A7, B7, C7, D7, E7, F7, G7, H7,
    A8, B8, C8, D8, E8, F8, G8, H8,
};
// clang-format on

// ── Color ───────────────────────────────────────────────────────────────────
enum class Color : std::uint8_t { White = 0, Black = 1 };

[[nodiscard]] constexpr Color opposite(Color c) noexcept {
    return static_cast<Color>(static_cast<int>(c) ^ 1);
}
[[nodiscard]] constexpr int color_index(Color c) noexcept {
    return static_cast<int>(c);
}
[[nodiscard]] constexpr std::string_view color_name(Color c) noexcept {
    return c == Color::White ? "white" : "black";
}

/// Rank index (0-7) a color's pieces start on, and the one its pawns promote on.
[[nodiscard]] constexpr int home_rank(Color c) noexcept {
    return c == Color::White ? 0 : 7;
}
[[nodiscard]] constexpr int promotion_rank(Color c) noexcept {
    return c == Color::White ? 7 : 0;
}
[[nodiscard]] constexpr int pawn_direction(Color c) noexcept {
    return c == Color::White ? 1 : -1;
}

// ── PieceType ───────────────────────────────────────────────────────────────
enum class PieceType : std::uint8_t {
    None = 0,
    Pawn = 1,
    Knight = 2,
    Bishop = 3,
    Rook = 4,
    Queen = 5,
    King = 6,
};

inline constexpr int kNumPieceTypes = 6;

[[nodiscard]] constexpr int piece_index(PieceType pt) noexcept {
    return static_cast<int>(pt) - 1;  // Pawn=0 .. King=5
}

[[nodiscard]] constexpr bool is_slider(PieceType pt) noexcept {
    return pt == PieceType::Bishop || pt == PieceType::Rook || pt == PieceType::Queen;
}

// ── MoveFlag ────────────────────────────────────────────────────────────────
enum class MoveFlag : std::uint8_t {
    Normal = 0,
    DoublePawn = 1,
    EnPassant = 2,
    CastleKingside = 3,
    CastleQueenside = 4,
    Promotion = 5,
};

// ── CastlingRights ──────────────────────────────────────────────────────────
enum CastlingRights : std::uint8_t {
    kCastlingNone = 0,
    kWhiteKingside = 1,
    kWhiteQueenside = 2,
    kBlackKingside = 4,
    kBlackQueenside = 8,
    kWhiteBoth = kWhiteKingside | kWhiteQueenside,
    kBlackBoth = kBlackKingside | kBlackQueenside,
    kCastlingAll = kWhiteBoth | kBlackBoth,
};

[[nodiscard]] constexpr CastlingRights operator|(CastlingRights a, CastlingRights b) noexcept {
    return static_cast<CastlingRights>(static_cast<int>(a) | static_cast<int>(b));
}
[[nodiscard]] constexpr CastlingRights operator&(CastlingRights a, CastlingRights b) noexcept {
    return static_cast<CastlingRights>(static_cast<int>(a) & static_cast<int>(b));
}
[[nodiscard]] constexpr CastlingRights operator~(CastlingRights a) noexcept {
    return static_cast<CastlingRights>(~static_cast<int>(a) & 0xF);
}
constexpr CastlingRights& operator|=(CastlingRights& a, CastlingRights b) noexcept {
    a = a | b;
    return a;
}
constexpr CastlingRights& operator&=(CastlingRights& a, CastlingRights b) noexcept {
    a = a & b;
    return a;
}

[[nodiscard]] constexpr CastlingRights kingside_right(Color c) noexcept {
    return c == Color::White ? kWhiteKingside : kBlackKingside;
}
[[nodiscard]] constexpr CastlingRights queenside_right(Color c) noexcept {
    return c == Color::White ? kWhiteQueenside : kBlackQueenside;
}

}  // namespace arbiter
