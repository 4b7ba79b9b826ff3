/// @file codec.cpp
/// Binary position keys and FEN records.

#include <arbiter/codec.hpp>

#include <arbiter/errors.hpp>

#include <charconv>
#include <string>
#include <utility>
#include <vector>

namespace arbiter {

std::string_view to_string(RecordField field) noexcept {
    switch (field) {
        case RecordField::Layout:
            return "record";
        case RecordField::Placement:
            return "piece placement";
        case RecordField::SideToMove:
            return "side to move";
        case RecordField::Castling:
            return "castling availability";
        case RecordField::EnPassant:
            return "en passant target";
        case RecordField::HalfmoveClock:
            return "halfmove clock";
        case RecordField::FullmoveNumber:
            return "fullmove number";
        case RecordField::Key:
            return "position key";
    }
    return "unknown";
}

std::size_t PositionKeyHash::operator()(const PositionKey& key) const noexcept {
    // 64-bit FNV-1a over the packed bytes.
    std::uint64_t h = 0xcbf29ce484222325ULL;
    for (std::uint8_t b : key.bytes) {
        h ^= b;
        h *= 0x100000001b3ULL;
    }
    return static_cast<std::size_t>(h);
}

namespace codec {

namespace {

// ── Key helpers ─────────────────────────────────────────────────────────────

constexpr std::uint8_t kKindCodes[] = {
    0,  // None
    1,  // Pawn
    3,  // Knight
    4,  // Bishop
    2,  // Rook
    6,  // Queen
    5,  // King
};

constexpr PieceType kCodeKinds[] = {
    PieceType::None,   PieceType::Pawn, PieceType::Rook,  PieceType::Knight,
    PieceType::Bishop, PieceType::King, PieceType::Queen, PieceType::None,
};

/// Square stored at nibble index `i` (rank 8 first, files a..h).
constexpr Square square_for_index(int i) noexcept {
    return make_square(i % 8, 7 - i / 8);
}

/// Rank index of the en-passant target when `side` is to move.
constexpr int en_passant_rank(Color side) noexcept {
    return side == Color::White ? 5 : 2;
}

// ── Text helpers ────────────────────────────────────────────────────────────

auto split_spaces(std::string_view sv) -> std::vector<std::string_view> {
    std::vector<std::string_view> parts;
    std::size_t i = 0;
    while (i < sv.size()) {
        while (i < sv.size() && sv[i] == ' ') ++i;
        if (i >= sv.size()) break;
        std::size_t start = i;
        while (i < sv.size() && sv[i] != ' ') ++i;
        parts.push_back(sv.substr(start, i - start));
    }
    return parts;
}

int parse_int(std::string_view sv, int min_val, int max_val, RecordField field) {
    int val = 0;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), val);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) {
        throw MalformedRecord(field, "not an integer: '" + std::string(sv) + "'");
    }
    if (val < min_val) {
        throw MalformedRecord(field, "must be at least " + std::to_string(min_val));
    }
    if (val > max_val) {
        throw MalformedRecord(field, "must be at most " + std::to_string(max_val));
    }
    return val;
}

// ── Shared position checks ──────────────────────────────────────────────────

void check_kings(const Board& board, RecordField field) {
    for (Color c : {Color::White, Color::Black}) {
        if (board.count(c, PieceType::King) != 1) {
            throw MalformedRecord(field, std::string("expected exactly one ") +
                                             std::string(color_name(c)) + " king");
        }
    }
}

void check_pawn_ranks(const Board& board) {
    constexpr Bitboard kBackRanks = 0xFF000000000000FFULL;
    if ((board.pieces(Color::White, PieceType::Pawn) | board.pieces(Color::Black, PieceType::Pawn)) &
        kBackRanks) {
        throw MalformedRecord(RecordField::Placement, "pawn on the first or last rank");
    }
}

/// Rook file for a single castling right.
constexpr int castling_rook_file(CastlingRights right) noexcept {
    return (right == kWhiteKingside || right == kBlackKingside) ? 7 : 0;
}

constexpr Color castling_color(CastlingRights right) noexcept {
    return (right == kWhiteKingside || right == kWhiteQueenside) ? Color::White : Color::Black;
}

void check_castling_right(const Board& board, CastlingRights right, char letter) {
    const Color c = castling_color(right);
    const int r = home_rank(c);
    if (board.piece_at(make_square(4, r)) != Piece{c, PieceType::King} ||
        board.piece_at(make_square(castling_rook_file(right), r)) != Piece{c, PieceType::Rook}) {
        throw MalformedRecord(RecordField::Castling,
                              std::string("'") + letter + "' without king and rook on their squares");
    }
}

void check_en_passant(Square sq, const Board& board, Color side) {
    if (rank_of(sq) != en_passant_rank(side)) {
        throw MalformedRecord(RecordField::EnPassant,
                              square_name(sq) + " is not on the rank behind a double push");
    }
    // The opponent's pawn passed over sq and now stands one rank further on.
    const Color mover = opposite(side);
    const int dir = pawn_direction(mover);
    const Square origin = make_square(file_of(sq), rank_of(sq) - dir);
    const Square landed = make_square(file_of(sq), rank_of(sq) + dir);
    if (!board.is_empty(sq) || !board.is_empty(origin) ||
        board.piece_at(landed) != Piece{mover, PieceType::Pawn}) {
        throw MalformedRecord(RecordField::EnPassant,
                              square_name(sq) + " does not follow a double pawn push");
    }
}

void check_not_in_check(const Position& pos) {
    const Color waiting = opposite(pos.side_to_move());
    if (pos.is_in_check(waiting)) {
        throw MalformedRecord(RecordField::SideToMove, std::string(color_name(waiting)) +
                                                           " is in check but it is not their move");
    }
}

// ── Text parsing ────────────────────────────────────────────────────────────

Board parse_placement(std::string_view placement) {
    Board board;
    int rank = 7;
    int file = 0;

    for (char ch : placement) {
        if (ch == '/') {
            if (file != 8) {
                throw MalformedRecord(RecordField::Placement,
                                      "rank " + std::to_string(rank + 1) + " is not 8 squares wide");
            }
            if (--rank < 0) {
                throw MalformedRecord(RecordField::Placement, "more than 8 ranks");
            }
            file = 0;
        } else if (ch >= '1' && ch <= '8') {
            file += ch - '0';
            if (file > 8) {
                throw MalformedRecord(RecordField::Placement,
                                      "rank " + std::to_string(rank + 1) + " is wider than 8 squares");
            }
        } else {
            auto p = Piece::from_fen_char(ch);
            if (!p) {
                throw MalformedRecord(RecordField::Placement,
                                      std::string("unexpected character '") + ch + "'");
            }
            if (file >= 8) {
                throw MalformedRecord(RecordField::Placement,
                                      "rank " + std::to_string(rank + 1) + " is wider than 8 squares");
            }
            board.put_piece(make_square(file, rank), *p);
            ++file;
        }
    }
    if (rank != 0 || file != 8) {
        throw MalformedRecord(RecordField::Placement, "expected 8 ranks of 8 squares");
    }

    check_kings(board, RecordField::Placement);
    check_pawn_ranks(board);
    return board;
}

CastlingRights parse_castling(std::string_view field, const Board& board) {
    CastlingRights castling = kCastlingNone;
    if (field == "-") return castling;

    for (char ch : field) {
        CastlingRights right = kCastlingNone;
        switch (ch) {
            // clang-format off
            case 'K': right = kWhiteKingside; break;
            case 'Q': right = kWhiteQueenside; break;
            case 'k': right = kBlackKingside; break;
            case 'q': right = kBlackQueenside; break;
            // clang-format on
            default:
                throw MalformedRecord(RecordField::Castling,
                                      std::string("unexpected character '") + ch + "'");
        }
        if (castling & right) {
            throw MalformedRecord(RecordField::Castling, std::string("repeated '") + ch + "'");
        }
        check_castling_right(board, right, ch);
        castling |= right;
    }
    return castling;
}

Square parse_en_passant(std::string_view field, const Board& board, Color side) {
    if (field == "-") return kNoSquare;

    auto sq = parse_square(field);
    if (!sq) {
        throw MalformedRecord(RecordField::EnPassant, "not a square: '" + std::string(field) + "'");
    }
    check_en_passant(*sq, board, side);
    return *sq;
}

}  // namespace

// ── Binary key ──────────────────────────────────────────────────────────────

std::uint8_t square_code(Piece p) noexcept {
    if (p.type == PieceType::None) return 0;
    return static_cast<std::uint8_t>(kKindCodes[static_cast<int>(p.type)] << 1 |
                                     color_index(p.color));
}

PositionKey encode(const Position& pos) noexcept {
    PositionKey key;
    const Board& board = pos.board();
    for (int i = 0; i < 64; ++i) {
        std::uint8_t code = square_code(board.piece_at(square_for_index(i)));
        key.bytes[i / 2] |= (i % 2 == 0) ? static_cast<std::uint8_t>(code << 4) : code;
    }

    std::uint8_t meta = (pos.side_to_move() == Color::Black) ? 1 : 0;
    meta |= static_cast<std::uint8_t>(pos.castling() << 1);
    key.bytes[PositionKey::kBoardBytes] = meta;

    key.bytes[PositionKey::kBoardBytes + 1] =
        (pos.en_passant() == kNoSquare) ? 0 : static_cast<std::uint8_t>(file_of(pos.en_passant()) + 1);
    return key;
}

Position decode(const PositionKey& key) {
    Board board;
    for (int i = 0; i < 64; ++i) {
        std::uint8_t byte = key.bytes[i / 2];
        std::uint8_t code = (i % 2 == 0) ? (byte >> 4) : (byte & 0xF);
        if (code == 0) continue;

        PieceType kind = kCodeKinds[code >> 1];
        if (kind == PieceType::None) {
            throw MalformedRecord(RecordField::Key,
                                  "invalid square code " + std::to_string(code) + " at " +
                                      square_name(square_for_index(i)));
        }
        board.put_piece(square_for_index(i), {static_cast<Color>(code & 1), kind});
    }
    check_kings(board, RecordField::Key);

    const std::uint8_t meta = key.bytes[PositionKey::kBoardBytes];
    if (meta & 0xE0) {
        throw MalformedRecord(RecordField::Key, "unused meta bits are set");
    }
    const Color side = (meta & 1) ? Color::Black : Color::White;
    const auto castling = static_cast<CastlingRights>((meta >> 1) & 0xF);

    const std::uint8_t ep_file = key.bytes[PositionKey::kBoardBytes + 1];
    if (ep_file > 8) {
        throw MalformedRecord(RecordField::Key, "en passant file out of range");
    }
    const Square ep = (ep_file == 0) ? kNoSquare : make_square(ep_file - 1, en_passant_rank(side));

    return Position(board, side, castling, ep, 0, 1);
}

// ── Validation ──────────────────────────────────────────────────────────────

void validate(const Position& pos) {
    const Board& board = pos.board();
    check_kings(board, RecordField::Placement);
    check_pawn_ranks(board);

    constexpr std::pair<CastlingRights, char> kRights[] = {
        {kWhiteKingside, 'K'},
        {kWhiteQueenside, 'Q'},
        {kBlackKingside, 'k'},
        {kBlackQueenside, 'q'},
    };
    if (static_cast<int>(pos.castling()) & ~static_cast<int>(kCastlingAll)) {
        throw MalformedRecord(RecordField::Castling, "unknown castling bits are set");
    }
    for (auto [right, letter] : kRights) {
        if (pos.castling() & right) check_castling_right(board, right, letter);
    }

    if (pos.en_passant() > kNoSquare) {
        throw MalformedRecord(RecordField::EnPassant, "target is off the board");
    }
    if (pos.en_passant() != kNoSquare) {
        check_en_passant(pos.en_passant(), board, pos.side_to_move());
    }

    if (pos.halfmove_clock() < 0 || pos.halfmove_clock() > kMaxMoveCounter) {
        throw MalformedRecord(RecordField::HalfmoveClock,
                              "must be between 0 and " + std::to_string(kMaxMoveCounter));
    }
    if (pos.fullmove_number() < 1 || pos.fullmove_number() > kMaxMoveCounter) {
        throw MalformedRecord(RecordField::FullmoveNumber,
                              "must be between 1 and " + std::to_string(kMaxMoveCounter));
    }

    check_not_in_check(pos);
}

// ── FEN text ────────────────────────────────────────────────────────────────

std::string to_text(const Position& pos) {
    std::string fen;
    fen.reserve(90);
    const Board& board = pos.board();

    for (int rank = 7; rank >= 0; --rank) {
        if (rank < 7) fen += '/';
        int empty = 0;
        for (int file = 0; file < 8; ++file) {
            Piece p = board.piece_at(make_square(file, rank));
            if (p == kNoPiece) {
                ++empty;
                continue;
            }
            if (empty > 0) {
                fen += static_cast<char>('0' + empty);
                empty = 0;
            }
            fen += p.fen_char();
        }
        if (empty > 0) fen += static_cast<char>('0' + empty);
    }

    fen += (pos.side_to_move() == Color::White) ? " w " : " b ";

    const CastlingRights cr = pos.castling();
    if (cr == kCastlingNone) {
        fen += '-';
    } else {
        if (cr & kWhiteKingside) fen += 'K';
        if (cr & kWhiteQueenside) fen += 'Q';
        if (cr & kBlackKingside) fen += 'k';
        if (cr & kBlackQueenside) fen += 'q';
    }

    fen += ' ';
    fen += (pos.en_passant() == kNoSquare) ? std::string("-") : square_name(pos.en_passant());

    fen += ' ';
    fen += std::to_string(pos.halfmove_clock());
    fen += ' ';
    fen += std::to_string(pos.fullmove_number());
    return fen;
}

Position parse_text(std::string_view record) {
    auto parts = split_spaces(record);
    if (parts.size() < 4 || parts.size() > 6) {
        throw MalformedRecord(RecordField::Layout,
                              "expected 4 to 6 space-separated fields, got " +
                                  std::to_string(parts.size()));
    }

    Board board = parse_placement(parts[0]);

    Color side = Color::White;
    if (parts[1] == "b") {
        side = Color::Black;
    } else if (parts[1] != "w") {
        throw MalformedRecord(RecordField::SideToMove,
                              "expected 'w' or 'b', got '" + std::string(parts[1]) + "'");
    }

    CastlingRights castling = parse_castling(parts[2], board);
    Square ep = parse_en_passant(parts[3], board, side);

    int halfmove = (parts.size() > 4)
                       ? parse_int(parts[4], 0, kMaxMoveCounter, RecordField::HalfmoveClock)
                       : 0;
    int fullmove = (parts.size() > 5)
                       ? parse_int(parts[5], 1, kMaxMoveCounter, RecordField::FullmoveNumber)
                       : 1;

    Position pos(board, side, castling, ep, halfmove, fullmove);
    check_not_in_check(pos);
    return pos;
}

}  // namespace codec

}  // namespace arbiter
