#pragma once

/// @file codec.hpp
/// Position serialization: a fixed-width binary key and the FEN text record.

#include <arbiter/position.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace arbiter {

/// Packed position: board, side to move, castling rights, en-passant file.
///
/// Bytes 0-31 hold the board two squares per byte, scanned from rank 8 down
/// to rank 1 and file a to h, the first square of each pair in the high
/// nibble. A nibble is `kind << 1 | color`:
///
///   | kind   | code |      | color | bit |
///   |--------|------|      |-------|-----|
///   | empty  | 000  |      | white | 0   |
///   | pawn   | 001  |      | black | 1   |
///   | rook   | 010  |
///   | knight | 011  |
///   | bishop | 100  |
///   | king   | 101  |
///   | queen  | 110  |
///
/// Byte 32: bit 0 is the side to move (1 = black), bits 1-4 the castling rights.
/// Byte 33: en-passant file + 1, or 0 when there is no target.
struct PositionKey {
    static constexpr std::size_t kBoardBytes = 32;
    static constexpr std::size_t kSize = kBoardBytes + 2;

    std::array<std::uint8_t, kSize> bytes{};

    [[nodiscard]] bool operator==(const PositionKey&) const noexcept = default;
};

struct PositionKeyHash {
    [[nodiscard]] std::size_t operator()(const PositionKey& key) const noexcept;
};

namespace codec {

/// Upper bound accepted for the half-move clock and full-move number.
inline constexpr int kMaxMoveCounter = 1'000'000;

/// 4-bit code for one square.
[[nodiscard]] std::uint8_t square_code(Piece p) noexcept;

[[nodiscard]] PositionKey encode(const Position& pos) noexcept;

/// Inverse of encode. Clocks are not part of the key: the result has a
/// half-move clock of 0 and full-move number 1.
/// Throws MalformedRecord(RecordField::Key) for bit patterns encode never produces
/// and for boards without exactly one king per color.
[[nodiscard]] Position decode(const PositionKey& key);

/// Serialize to a six-field FEN record.
[[nodiscard]] std::string to_text(const Position& pos);

/// Parse and validate a FEN record. The two clock fields may be omitted.
/// Throws MalformedRecord naming the first offending field.
[[nodiscard]] Position parse_text(std::string_view record);

/// Check a position built by hand against everything parse_text enforces:
/// one king per color, no pawn on a back rank, castling rights backed by
/// king and rook, a consistent en-passant target, clocks within
/// [0, kMaxMoveCounter] and [1, kMaxMoveCounter], and the side not to move
/// not in check. Throws MalformedRecord naming the offending field.
void validate(const Position& pos);

}  // namespace codec

}  // namespace arbiter
