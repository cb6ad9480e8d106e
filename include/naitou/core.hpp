#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace naitou {

constexpr int N = 9;
constexpr int SQ_N = N * N; // 81
constexpr std::uint8_t SQ_NONE = 0xFF;

// HUM is sente (moves toward rank 1), COM is gote.
enum Side : std::uint8_t { HUM = 0, COM = 1 };

[[nodiscard]] constexpr Side other(Side s) {
  return (s == HUM) ? COM : HUM;
}

// Squares are indexed 9 * col + row, where col 0..8 is file 1..9 and
// row 0..8 is rank 1..9. Rank 1 is COM's back rank.
[[nodiscard]] constexpr bool inBounds(int c, int r) {
  return c >= 0 && c < N && r >= 0 && r < N;
}

[[nodiscard]] constexpr std::uint8_t sq(int c, int r) {
  return static_cast<std::uint8_t>(c * N + r);
}

[[nodiscard]] constexpr int col(std::uint8_t s) {
  return static_cast<int>(s) / N;
}

[[nodiscard]] constexpr int row(std::uint8_t s) {
  return static_cast<int>(s) % N;
}

// Square by its printed name, e.g. sqAt(7, 6) for "76".
[[nodiscard]] constexpr std::uint8_t sqAt(int file, int rank) {
  return sq(file - 1, rank - 1);
}

// Directions as seen from HUM. Values matter: they index DirSet bits and
// inv(d) == 7 - d.
enum Direction : std::uint8_t { DIR_RU = 0, DIR_R, DIR_RD, DIR_U, DIR_D, DIR_LU, DIR_L, DIR_LD };

constexpr std::array<int, 8> DIR_DC = {-1, -1, -1, 0, 0, 1, 1, 1};
constexpr std::array<int, 8> DIR_DR = {-1, 0, 1, -1, 1, -1, 0, 1};

[[nodiscard]] constexpr Direction invDir(Direction d) {
  return static_cast<Direction>(7 - d);
}

using DirSet = std::uint8_t;
// Low byte holds HUM's directions, high byte COM's.
using DirSetPair = std::uint16_t;

[[nodiscard]] constexpr DirSet dirBit(int d) {
  return static_cast<DirSet>(1u << d);
}

constexpr DirSet DIRS_DIAG = dirBit(DIR_RU) | dirBit(DIR_RD) | dirBit(DIR_LU) | dirBit(DIR_LD);
constexpr DirSet DIRS_AXIS = dirBit(DIR_R) | dirBit(DIR_U) | dirBit(DIR_D) | dirBit(DIR_L);
constexpr DirSet DIRS_ALL = 0xFF;
constexpr DirSetPair DSP_ALL = 0xFFFF;

[[nodiscard]] constexpr DirSetPair dspPart(Side s, DirSet d) {
  return static_cast<DirSetPair>(static_cast<unsigned>(d) << (8 * s));
}

[[nodiscard]] constexpr DirSetPair dspBoth(DirSet d) {
  return static_cast<DirSetPair>(d | (static_cast<unsigned>(d) << 8));
}

[[nodiscard]] constexpr DirSet dspGet(DirSetPair p, Side s) {
  return static_cast<DirSet>(p >> (8 * s));
}

enum PieceKind : std::uint8_t {
  NO_KIND = 0,
  PAWN,
  LANCE,
  KNIGHT,
  SILVER,
  BISHOP,
  ROOK,
  GOLD,
  KING,
  PRO_PAWN,
  PRO_LANCE,
  PRO_KNIGHT,
  PRO_SILVER,
  HORSE,
  DRAGON,
};

constexpr int KIND_N = 15;

[[nodiscard]] constexpr bool isPromotable(PieceKind k) {
  return k >= PAWN && k <= ROOK;
}

[[nodiscard]] constexpr bool isPromoted(PieceKind k) {
  return k >= PRO_PAWN;
}

[[nodiscard]] constexpr PieceKind promoted(PieceKind k) {
  return static_cast<PieceKind>(k | 8);
}

// Kind as it goes into a hand.
[[nodiscard]] constexpr PieceKind rawKind(PieceKind k) {
  return (k == KING) ? KING : static_cast<PieceKind>(k & 7);
}

using Piece = std::uint8_t;
constexpr Piece NO_PIECE = 0;

[[nodiscard]] constexpr Piece makePiece(Side s, PieceKind k) {
  return static_cast<Piece>((s << 4) | k);
}

[[nodiscard]] constexpr Side pieceSide(Piece p) {
  return static_cast<Side>(p >> 4);
}

[[nodiscard]] constexpr PieceKind pieceKind(Piece p) {
  return static_cast<PieceKind>(p & 15);
}

constexpr Piece H_KNIGHT = makePiece(HUM, KNIGHT);

using Board = std::array<Piece, SQ_N>;
// Counts indexed by kind PAWN..GOLD; slot 0 is unused.
using Hand = std::array<std::uint8_t, 8>;
using Hands = std::array<Hand, 2>;

// Order used when printing hands.
constexpr std::array<PieceKind, 7> HAND_KINDS = {ROOK, BISHOP, GOLD, SILVER, KNIGHT, LANCE, PAWN};

[[nodiscard]] std::string squareToString(std::uint8_t s);
[[nodiscard]] std::optional<std::uint8_t> parseSquare(std::string_view s);

[[nodiscard]] constexpr std::string_view sideName(Side s) {
  return (s == HUM) ? "HUM" : "COM";
}

[[nodiscard]] constexpr std::string_view kindName(PieceKind k) {
  switch (k) {
    case PAWN: return "FU";
    case LANCE: return "KY";
    case KNIGHT: return "KE";
    case SILVER: return "GI";
    case BISHOP: return "KA";
    case ROOK: return "HI";
    case GOLD: return "KI";
    case KING: return "OU";
    case PRO_PAWN: return "TO";
    case PRO_LANCE: return "NY";
    case PRO_KNIGHT: return "NK";
    case PRO_SILVER: return "NG";
    case HORSE: return "UM";
    case DRAGON: return "RY";
    default: return "--";
  }
}

// Board of the even game, HUM to move.
[[nodiscard]] Board evenBoard();

} // namespace naitou
