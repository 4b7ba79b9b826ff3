/// @file test_codec.cpp
/// Tests for codec.hpp: binary position keys and FEN records.

#include <arbiter/codec.hpp>
#include <arbiter/errors.hpp>
#include <arbiter/movegen.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace arbiter;

namespace {

/// Run `record` through parse_text and report the field it was rejected on.
RecordField rejected_field(const std::string& record) {
    try {
        (void)codec::parse_text(record);
    } catch (const MalformedRecord& e) {
        return e.field();
    }
    ADD_FAILURE() << "accepted: " << record;
    return RecordField::Layout;
}

/// Field named by the MalformedRecord that validate throws for `pos`.
RecordField invalid_field(const Position& pos) {
    try {
        codec::validate(pos);
    } catch (const MalformedRecord& e) {
        return e.field();
    }
    ADD_FAILURE() << "accepted: " << codec::to_text(pos);
    return RecordField::Layout;
}

constexpr const char* kKiwipete =
    "r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1";

/// Check both codecs at every node of the legal-move tree below `pos`.
void walk_round_trips(Position& pos, int depth, int& nodes) {
    ++nodes;
    const PositionKey key = codec::encode(pos);
    EXPECT_EQ(codec::encode(codec::decode(key)), key) << codec::to_text(pos);
    EXPECT_TRUE(codec::decode(key).same_placement(pos)) << codec::to_text(pos);
    EXPECT_EQ(codec::parse_text(codec::to_text(pos)), pos) << codec::to_text(pos);
    if (depth == 0) return;

    for (const Move& m : movegen::legal(pos)) {
        HistoryEntry entry = pos.make_move(m);
        walk_round_trips(pos, depth - 1, nodes);
        pos.unmake_move(entry);
    }
}

}  // namespace

// ── Binary key ──────────────────────────────────────────────────────────────

TEST(Codec, SquareCodes) {
    EXPECT_EQ(codec::square_code(kNoPiece), 0b0000);
    EXPECT_EQ(codec::square_code({Color::White, PieceType::Pawn}), 0b0010);
    EXPECT_EQ(codec::square_code({Color::Black, PieceType::Pawn}), 0b0011);
    EXPECT_EQ(codec::square_code({Color::White, PieceType::Rook}), 0b0100);
    EXPECT_EQ(codec::square_code({Color::White, PieceType::Knight}), 0b0110);
    EXPECT_EQ(codec::square_code({Color::White, PieceType::Bishop}), 0b1000);
    EXPECT_EQ(codec::square_code({Color::Black, PieceType::King}), 0b1011);
    EXPECT_EQ(codec::square_code({Color::White, PieceType::Queen}), 0b1100);
}

TEST(Codec, StartingPositionKeyBytes) {
    PositionKey key = codec::encode(Position::initial());

    EXPECT_EQ(key.bytes[0], 0b01010111);  // a8 rook, b8 knight
    EXPECT_EQ(key.bytes[1], 0b10011101);  // c8 bishop, d8 queen
    EXPECT_EQ(key.bytes[2], 0b10111001);  // e8 king, f8 bishop
    EXPECT_EQ(key.bytes[3], 0b01110101);  // g8 knight, h8 rook
    for (int i = 4; i < 8; ++i) EXPECT_EQ(key.bytes[i], 0b00110011) << i;
    for (int i = 8; i < 24; ++i) EXPECT_EQ(key.bytes[i], 0) << i;
    for (int i = 24; i < 28; ++i) EXPECT_EQ(key.bytes[i], 0b00100010) << i;
    EXPECT_EQ(key.bytes[28], 0b01000110);
    EXPECT_EQ(key.bytes[29], 0b10001100);
    EXPECT_EQ(key.bytes[30], 0b10101000);
    EXPECT_EQ(key.bytes[31], 0b01100100);

    EXPECT_EQ(key.bytes[32], 0b00011110);  // white to move, all four rights
    EXPECT_EQ(key.bytes[33], 0);
}

TEST(Codec, KeyCarriesSideAndEnPassant) {
    Position pos = codec::parse_text("rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq e3 0 1");
    PositionKey key = codec::encode(pos);
    EXPECT_EQ(key.bytes[32] & 1, 1);
    EXPECT_EQ(key.bytes[33], 5);  // e-file + 1
}

TEST(Codec, DecodeInvertsEncode) {
    const char* records[] = {
        "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1",
        kKiwipete,
        "rnbqkbnr/ppp1pppp/8/8/3pP3/8/PPPP1PPP/RNBQKBNR b Kq e3 0 1",
        "rnbqkbnr/pppp1ppp/8/3Pp3/8/8/PPP1PPPP/RNBQKBNR w KQkq e6 0 1",
        "8/2p5/3p4/KP5r/1R3p1k/8/4P1P1/8 w - - 0 1",
    };
    for (const char* r : records) {
        Position pos = codec::parse_text(r);
        Position back = codec::decode(codec::encode(pos));
        EXPECT_TRUE(back.same_placement(pos)) << r;
        EXPECT_EQ(back.halfmove_clock(), 0);
        EXPECT_EQ(back.fullmove_number(), 1);
    }
}

TEST(Codec, KeyIgnoresClocks) {
    Position a = codec::parse_text("4k3/8/8/8/8/8/8/4K3 w - - 0 1");
    Position b = codec::parse_text("4k3/8/8/8/8/8/8/4K3 w - - 37 60");
    EXPECT_EQ(codec::encode(a), codec::encode(b));
    EXPECT_EQ(PositionKeyHash{}(codec::encode(a)), PositionKeyHash{}(codec::encode(b)));
}

TEST(Codec, KeyHashSeparatesPositions) {
    const PositionKeyHash hash;
    const PositionKey start = codec::encode(Position::initial());
    PositionKey black = start;
    black.bytes[PositionKey::kBoardBytes] |= 1;
    PositionKey moved = start;
    moved.bytes[0] = 0;

    EXPECT_EQ(hash(start), hash(codec::encode(Position::initial())));
    EXPECT_NE(hash(start), hash(black));
    EXPECT_NE(hash(start), hash(moved));
    EXPECT_NE(hash(black), hash(moved));
}

TEST(Codec, DecodeRejectsReservedCode) {
    PositionKey key = codec::encode(Position::initial());
    key.bytes[10] = 0xE0;  // kind 7 on e6
    try {
        (void)codec::decode(key);
        FAIL() << "expected MalformedRecord";
    } catch (const MalformedRecord& e) {
        EXPECT_EQ(e.field(), RecordField::Key);
    }
}

TEST(Codec, DecodeRejectsColorWithoutKind) {
    PositionKey key = codec::encode(Position::initial());
    key.bytes[12] = 0x10;  // code 0001
    EXPECT_THROW((void)codec::decode(key), MalformedRecord);
}

TEST(Codec, DecodeRejectsBadMeta) {
    PositionKey key = codec::encode(Position::initial());
    key.bytes[32] |= 0x80;
    EXPECT_THROW((void)codec::decode(key), MalformedRecord);

    key = codec::encode(Position::initial());
    key.bytes[33] = 9;
    EXPECT_THROW((void)codec::decode(key), MalformedRecord);
}

TEST(Codec, EveryReachablePositionRoundTrips) {
    int nodes = 0;
    Position start = Position::initial();
    walk_round_trips(start, 3, nodes);
    EXPECT_EQ(nodes, 1 + 20 + 400 + 8902);

    nodes = 0;
    Position kiwipete = codec::parse_text(kKiwipete);
    walk_round_trips(kiwipete, 2, nodes);
    EXPECT_EQ(nodes, 1 + 48 + 2039);
}

TEST(Codec, EncodeInvertsDecode) {
    // Hand-built keys that encode could have produced.
    PositionKey key{};
    key.bytes[2] = 0xB0;                           // e8: black king
    key.bytes[30] = 0xA0;                          // e1: white king
    key.bytes[31] = 0x04;                          // h1: white rook
    key.bytes[PositionKey::kBoardBytes] = 0b0011;  // black to move, white kingside
    EXPECT_EQ(codec::encode(codec::decode(key)), key);

    PositionKey ep = codec::encode(
        codec::parse_text("rnbqkbnr/pppp1ppp/8/3Pp3/8/8/PPP1PPPP/RNBQKBNR w KQkq e6 0 1"));
    EXPECT_EQ(codec::encode(codec::decode(ep)), ep);
}

// ── FEN: serialization ──────────────────────────────────────────────────────

TEST(Codec, StartingFen) {
    EXPECT_EQ(codec::to_text(Position::initial()), kStartingFen);
}

TEST(Codec, FenRoundTrip) {
    const char* records[] = {
        kKiwipete,
        "rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq e3 0 1",
        "8/8/8/8/8/8/8/K6k b - - 99 140",
        "r3k2r/8/8/8/8/8/8/R3K2R w Kq - 3 20",
    };
    for (const char* r : records) {
        EXPECT_EQ(codec::to_text(codec::parse_text(r)), r);
    }
}

TEST(Codec, FenClockFieldsOptional) {
    Position pos = codec::parse_text("4k3/8/8/8/8/8/8/4K3 b - -");
    EXPECT_EQ(pos.side_to_move(), Color::Black);
    EXPECT_EQ(pos.castling(), kCastlingNone);
    EXPECT_EQ(pos.en_passant(), kNoSquare);
    EXPECT_EQ(pos.halfmove_clock(), 0);
    EXPECT_EQ(pos.fullmove_number(), 1);

    Position five = codec::parse_text("4k3/8/8/8/8/8/8/4K3 w - - 12");
    EXPECT_EQ(five.halfmove_clock(), 12);
    EXPECT_EQ(five.fullmove_number(), 1);
}

TEST(Codec, FenToleratesExtraSpaces) {
    Position pos = codec::parse_text("  4k3/8/8/8/8/8/8/4K3   w  -  -  0  1 ");
    EXPECT_EQ(codec::to_text(pos), "4k3/8/8/8/8/8/8/4K3 w - - 0 1");
}

// ── FEN: rejection ──────────────────────────────────────────────────────────

TEST(Codec, RejectsLayout) {
    EXPECT_EQ(rejected_field(""), RecordField::Layout);
    EXPECT_EQ(rejected_field("not a fen"), RecordField::Layout);
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/4K3 w - - 0 1 extra"), RecordField::Layout);
}

TEST(Codec, RejectsPlacement) {
    EXPECT_EQ(rejected_field("8/8/8 w - -"), RecordField::Placement);
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/4K2 w - -"), RecordField::Placement);
    EXPECT_EQ(rejected_field("4k3/9/8/8/8/8/8/4K3 w - -"), RecordField::Placement);
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/4K3/8 w - -"), RecordField::Placement);
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/4X3 w - -"), RecordField::Placement);
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/8 w - -"), RecordField::Placement);
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/3KK3 w - -"), RecordField::Placement);
    EXPECT_EQ(rejected_field("P3k3/8/8/8/8/8/8/4K3 w - -"), RecordField::Placement);
}

TEST(Codec, RejectsSideToMove) {
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/4K3 x - -"), RecordField::SideToMove);
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/4K3 white - -"), RecordField::SideToMove);
}

TEST(Codec, RejectsOpponentInCheck) {
    // Black king attacked by the rook while white is to move.
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/4RK2 w - - 0 1"), RecordField::SideToMove);
    EXPECT_NO_THROW((void)codec::parse_text("4k3/8/8/8/8/8/8/4RK2 b - - 0 1"));
}

TEST(Codec, RejectsCastling) {
    EXPECT_EQ(rejected_field("r3k2r/8/8/8/8/8/8/R3K2R w KX - 0 1"), RecordField::Castling);
    EXPECT_EQ(rejected_field("r3k2r/8/8/8/8/8/8/R3K2R w KK - 0 1"), RecordField::Castling);
    // Right claimed without the rook at home.
    EXPECT_EQ(rejected_field("r3k3/8/8/8/8/8/8/R3K2R w k - 0 1"), RecordField::Castling);
    // Right claimed with the king away from e1.
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/R2K3R w Q - 0 1"), RecordField::Castling);
}

TEST(Codec, RejectsEnPassant) {
    EXPECT_EQ(rejected_field("4k3/8/8/8/4P3/8/8/4K3 b - e9 0 1"), RecordField::EnPassant);
    // Wrong rank for the side to move.
    EXPECT_EQ(rejected_field("4k3/8/8/8/4P3/8/8/4K3 w - e3 0 1"), RecordField::EnPassant);
    // No pawn in front of the target.
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/4K3 b - e3 0 1"), RecordField::EnPassant);
    // Origin square occupied.
    EXPECT_EQ(rejected_field("4k3/8/8/8/4P3/8/4P3/4K3 b - e3 0 1"), RecordField::EnPassant);
}

TEST(Codec, RejectsClocks) {
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/4K3 w - - -1 1"), RecordField::HalfmoveClock);
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/4K3 w - - x 1"), RecordField::HalfmoveClock);
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/4K3 w - - 0 0"), RecordField::FullmoveNumber);
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/4K3 w - - 0 1x"), RecordField::FullmoveNumber);
}

TEST(Codec, RejectsClocksAboveBound) {
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/4K2R b - - 0 2147483647"),
              RecordField::FullmoveNumber);
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/4K3 w - - 0 1000001"), RecordField::FullmoveNumber);
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/4K3 w - - 1000001 1"), RecordField::HalfmoveClock);
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/4K3 w - - 99999999999 1"), RecordField::HalfmoveClock);

    Position max = codec::parse_text("4k3/8/8/8/8/8/8/4K3 w - - 1000000 1000000");
    EXPECT_EQ(max.halfmove_clock(), codec::kMaxMoveCounter);
    EXPECT_EQ(max.fullmove_number(), codec::kMaxMoveCounter);
}

TEST(Codec, MalformedRecordMessageNamesField) {
    try {
        (void)codec::parse_text("4k3/8/8/8/8/8/8/4K3 w - - 0 0");
        FAIL() << "expected MalformedRecord";
    } catch (const MalformedRecord& e) {
        EXPECT_EQ(std::string(e.what()).rfind("fullmove number: ", 0), 0u);
        EXPECT_FALSE(e.reason().empty());
    }
}

TEST(Codec, MalformedRecordIsInvalidArgument) {
    EXPECT_THROW((void)codec::parse_text("garbage"), std::invalid_argument);
}

TEST(Codec, DecodeRejectsMissingKing) {
    PositionKey key = codec::encode(Position::initial());
    key.bytes[30] &= 0x0F;  // clear e1
    EXPECT_THROW((void)codec::decode(key), MalformedRecord);
}

// ── Validation ──────────────────────────────────────────────────────────────

TEST(Codec, ValidateAcceptsParsedPositions) {
    EXPECT_NO_THROW(codec::validate(Position::initial()));
    EXPECT_NO_THROW(codec::validate(codec::parse_text(kKiwipete)));
    EXPECT_NO_THROW(codec::validate(
        codec::parse_text("rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq e3 0 1")));
}

TEST(Codec, ValidateRejectsHandBuiltPositions) {
    Board kings;
    kings.put_piece(E1, {Color::White, PieceType::King});
    kings.put_piece(E8, {Color::Black, PieceType::King});

    EXPECT_EQ(invalid_field(Position{}), RecordField::Placement);

    Board pawn_home = kings;
    pawn_home.put_piece(A1, {Color::White, PieceType::Pawn});
    EXPECT_EQ(invalid_field(Position(pawn_home, Color::White, kCastlingNone, kNoSquare, 0, 1)),
              RecordField::Placement);

    EXPECT_EQ(invalid_field(Position(kings, Color::White, kWhiteKingside, kNoSquare, 0, 1)),
              RecordField::Castling);
    EXPECT_EQ(invalid_field(Position(kings, Color::White, kCastlingNone, E6, 0, 1)),
              RecordField::EnPassant);
    EXPECT_EQ(invalid_field(Position(kings, Color::White, kCastlingNone, Square{200}, 0, 1)),
              RecordField::EnPassant);
    EXPECT_EQ(invalid_field(Position(kings, Color::White, kCastlingNone, kNoSquare, -1, 1)),
              RecordField::HalfmoveClock);
    EXPECT_EQ(invalid_field(Position(kings, Color::White, kCastlingNone, kNoSquare, 0, 0)),
              RecordField::FullmoveNumber);
    EXPECT_EQ(invalid_field(Position(kings, Color::Black, kCastlingNone, kNoSquare, 0,
                                     codec::kMaxMoveCounter + 1)),
              RecordField::FullmoveNumber);

    Board exposed = kings;
    exposed.put_piece(E2, {Color::White, PieceType::Rook});
    EXPECT_EQ(invalid_field(Position(exposed, Color::White, kCastlingNone, kNoSquare, 0, 1)),
              RecordField::SideToMove);
    EXPECT_NO_THROW(
        codec::validate(Position(exposed, Color::Black, kCastlingNone, kNoSquare, 0, 1)));
}
