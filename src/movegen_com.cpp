#include "naitou/movegen.hpp"

#include <array>
#include <cassert>
#include <span>

#include "naitou/tables.hpp"

namespace naitou {

namespace {

// Directions in the order COM tries them.
std::span<const Direction> comRangedDirs(PieceKind k) {
  static constexpr std::array LANCE_DIRS = {DIR_D};
  static constexpr std::array BISHOP_DIRS = {DIR_LU, DIR_RU, DIR_LD, DIR_RD};
  static constexpr std::array ROOK_DIRS = {DIR_U, DIR_D, DIR_L, DIR_R};
  switch (k) {
    case LANCE: return LANCE_DIRS;
    case BISHOP:
    case HORSE: return BISHOP_DIRS;
    case ROOK:
    case DRAGON: return ROOK_DIRS;
    default: return {};
  }
}

std::span<const Direction> comMeleeDirs(PieceKind k) {
  static constexpr std::array PAWN_DIRS = {DIR_D};
  static constexpr std::array SILVER_DIRS = {DIR_RD, DIR_D, DIR_LD, DIR_RU, DIR_LU};
  static constexpr std::array GOLD_DIRS = {DIR_RD, DIR_D, DIR_LD, DIR_R, DIR_L, DIR_U};
  static constexpr std::array KING_DIRS = {DIR_RD, DIR_D, DIR_LD, DIR_R, DIR_L, DIR_RU, DIR_U, DIR_LU};
  // Steps a promoted bishop or rook adds to its slides.
  static constexpr std::array HORSE_DIRS = {DIR_D, DIR_R, DIR_L, DIR_U};
  static constexpr std::array DRAGON_DIRS = {DIR_RD, DIR_LD, DIR_RU, DIR_LU};
  switch (k) {
    case PAWN: return PAWN_DIRS;
    case SILVER: return SILVER_DIRS;
    case GOLD:
    case PRO_PAWN:
    case PRO_LANCE:
    case PRO_KNIGHT:
    case PRO_SILVER: return GOLD_DIRS;
    case KING: return KING_DIRS;
    case HORSE: return HORSE_DIRS;
    case DRAGON: return DRAGON_DIRS;
    default: return {};
  }
}

void pushCom(PieceKind k, std::uint8_t src, std::uint8_t dst, MoveList& out) {
  const bool promo = isPromotable(k) && (inPromotionZone(COM, src) || inPromotionZone(COM, dst));
  out.push(Move::walk(src, dst, promo));
}

void walkCom(const Position& pos, std::uint8_t src, PieceKind k, Bitboard81 target, MoveList& out) {
  const Tables& t = tables();

  for (Direction d : comRangedDirs(k)) {
    for (std::uint8_t dst = t.next[src][d]; dst != SQ_NONE && target.test(dst); dst = t.next[dst][d]) {
      pushCom(k, src, dst, out);
      if (pos.at(dst) != NO_PIECE) break;
    }
  }

  if (k == KNIGHT) {
    // RDD then LDD
    for (int dc : {-1, 1}) {
      const int c = col(src) + dc;
      const int r = row(src) + 2;
      if (inBounds(c, r) && target.test(sq(c, r))) pushCom(k, src, sq(c, r), out);
    }
    return;
  }

  for (Direction d : comMeleeDirs(k)) {
    const std::uint8_t dst = t.next[src][d];
    if (dst != SQ_NONE && target.test(dst)) pushCom(k, src, dst, out);
  }
}

void dropCom(const Position& pos, std::uint8_t dst, Bitboard81 pawnDrop, MoveList& out) {
  if (pos.hand(COM, PAWN) > 0 && pawnDrop.test(dst)) out.push(Move::dropOf(PAWN, dst));
  if (pos.hand(COM, LANCE) > 0 && row(dst) != N - 1) out.push(Move::dropOf(LANCE, dst));
  if (pos.hand(COM, KNIGHT) > 0 && row(dst) <= N - 3) out.push(Move::dropOf(KNIGHT, dst));
  for (PieceKind k : {SILVER, GOLD, BISHOP, ROOK}) {
    if (pos.hand(COM, k) > 0) out.push(Move::dropOf(k, dst));
  }
}

} // namespace

void generateMovesCom(const Position& pos, MoveList& out) {
  assert(pos.sideToMove() == COM);
  out.clear();

  const Bitboard81 target = ~pos.occupiedBy(COM);
  const Bitboard81 pawnDrop = pawnDropMask(COM, pos.pieces(COM, PAWN));

  for (int r = 0; r < N; ++r) {
    for (int c = N - 1; c >= 0; --c) {
      const std::uint8_t s = sq(c, r);
      const Piece pc = pos.at(s);
      if (pc == NO_PIECE) dropCom(pos, s, pawnDrop, out);
      else if (pieceSide(pc) == COM) walkCom(pos, s, pieceKind(pc), target, out);
    }
  }
}

} // namespace naitou
