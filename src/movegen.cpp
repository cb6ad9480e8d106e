#include "naitou/movegen.hpp"

#include <cassert>

#include "naitou/tables.hpp"

namespace naitou {

namespace {

void walkPawns(const Position& pos, Bitboard81 target, MoveList& out) {
  const Tables& t = tables();
  const Side us = pos.sideToMove();
  const int forward = (us == HUM) ? DIR_U : DIR_D;
  const int deadRow = (us == HUM) ? 0 : N - 1;

  Bitboard81 pawns = pos.pieces(us, PAWN);
  Bitboard81 dsts;
  while (pawns.any()) dsts.set(t.next[pawns.pop_lsb()][forward]);
  dsts &= target;

  while (dsts.any()) {
    const std::uint8_t dst = dsts.pop_lsb();
    const auto src = static_cast<std::uint8_t>((us == HUM) ? dst + 1 : dst - 1);
    if (inPromotionZone(us, dst)) {
      out.push(Move::walk(src, dst, true));
      if (row(dst) != deadRow) out.push(Move::walk(src, dst));
    } else {
      out.push(Move::walk(src, dst));
    }
  }
}

void pushEach(std::uint8_t src, Bitboard81 dsts, bool promo, MoveList& out) {
  while (dsts.any()) out.push(Move::walk(src, dsts.pop_lsb(), promo));
}

void pushBoth(std::uint8_t src, Bitboard81 dsts, MoveList& out) {
  while (dsts.any()) {
    const std::uint8_t dst = dsts.pop_lsb();
    out.push(Move::walk(src, dst, true));
    out.push(Move::walk(src, dst));
  }
}

void walkPieces(const Position& pos, Bitboard81 target, PieceKind k, MoveList& out) {
  const Side us = pos.sideToMove();
  const Piece pc = makePiece(us, k);
  const Bitboard81 zone = tables().promotionZone[us];

  Bitboard81 srcs = pos.pieces(us, k);
  while (srcs.any()) {
    const std::uint8_t src = srcs.pop_lsb();
    Bitboard81 dsts = target & effect(pc, src, pos.occupied());

    switch (k) {
      case LANCE:
        pushEach(src, dsts & zone, true, out);
        pushEach(src, dsts.andNot(farRows(us, 1)), false, out);
        break;
      case KNIGHT: {
        const int plainRow = (us == HUM) ? 2 : 6;
        while (dsts.any()) {
          const std::uint8_t dst = dsts.pop_lsb();
          if (inPromotionZone(us, dst)) {
            out.push(Move::walk(src, dst, true));
            if (row(dst) == plainRow) out.push(Move::walk(src, dst));
          } else {
            out.push(Move::walk(src, dst));
          }
        }
        break;
      }
      case SILVER:
      case BISHOP:
      case ROOK:
        if (inPromotionZone(us, src)) {
          pushBoth(src, dsts, out);
        } else {
          pushBoth(src, dsts & zone, out);
          pushEach(src, dsts.andNot(zone), false, out);
        }
        break;
      default:
        pushEach(src, dsts, false, out);
        break;
    }
  }
}

void drops(const Position& pos, Bitboard81 target, MoveList& out) {
  const Side us = pos.sideToMove();

  auto dropAll = [&](PieceKind k, Bitboard81 dsts) {
    while (dsts.any()) out.push(Move::dropOf(k, dsts.pop_lsb()));
  };

  if (pos.hand(us, PAWN) > 0) dropAll(PAWN, target & pawnDropMask(us, pos.pieces(us, PAWN)));
  if (pos.hand(us, LANCE) > 0) dropAll(LANCE, target.andNot(farRows(us, 1)));
  if (pos.hand(us, KNIGHT) > 0) dropAll(KNIGHT, target.andNot(farRows(us, 2)));
  for (PieceKind k : {SILVER, GOLD, BISHOP, ROOK}) {
    if (pos.hand(us, k) > 0) dropAll(k, target);
  }
}

constexpr PieceKind WALK_KINDS[] = {LANCE, KNIGHT, SILVER, BISHOP, ROOK, GOLD, KING,
                                    PRO_PAWN, PRO_LANCE, PRO_KNIGHT, PRO_SILVER, HORSE, DRAGON};
constexpr PieceKind EVASION_KINDS[] = {LANCE, KNIGHT, SILVER, BISHOP, ROOK, GOLD,
                                       PRO_PAWN, PRO_LANCE, PRO_KNIGHT, PRO_SILVER, HORSE, DRAGON};

// Squares a non-king move must land on to possibly answer the check.
Bitboard81 evasionTarget(const Position& pos) {
  const Side us = pos.sideToMove();
  const Side them = other(us);
  const std::uint8_t ksq = pos.kingSq(us);

  const Bitboard81 knights = pos.pieces(them, KNIGHT) & tables().knightEffect[us][ksq];
  if (knights.any()) return knights;
  return queenEffect(ksq, pos.occupied()).andNot(pos.occupiedBy(us));
}

void evasions(const Position& pos, Bitboard81 dropTarget, MoveList& out) {
  const Side us = pos.sideToMove();
  const Side them = other(us);
  const std::uint8_t ksq = pos.kingSq(us);

  Bitboard81 kingDsts = tables().kingEffect[ksq].andNot(pos.occupiedBy(us));
  while (kingDsts.any()) {
    const std::uint8_t dst = kingDsts.pop_lsb();
    if (pos.effectCount(them, dst) == 0) out.push(Move::walk(ksq, dst));
  }

  const Bitboard81 target = evasionTarget(pos);
  walkPawns(pos, target, out);
  for (PieceKind k : EVASION_KINDS) walkPieces(pos, target, k, out);
  drops(pos, target & dropTarget, out);
}

bool escapes(Position& pos, const Move& m) {
  const Side us = pos.sideToMove();
  const UndoableMove u = pos.doMove(m);
  const bool ok = !pos.isChecked(us);
  pos.undoMove(u);
  return ok;
}

bool anyEscape(Position& pos, const MoveList& moves) {
  for (const Move& m : moves) {
    if (escapes(pos, m)) return true;
  }
  return false;
}

// Tries replies group by group and stops at the first one that works.
bool isCheckmatedImpl(Position& pos, Bitboard81 dropTarget) {
  const Side us = pos.sideToMove();
  const Side them = other(us);
  const std::uint8_t ksq = pos.kingSq(us);
  assert(pos.isChecked(us));

  Bitboard81 kingDsts = tables().kingEffect[ksq].andNot(pos.occupiedBy(us));
  while (kingDsts.any()) {
    const std::uint8_t dst = kingDsts.pop_lsb();
    if (pos.effectCount(them, dst) > 0) continue;
    if (escapes(pos, Move::walk(ksq, dst))) return false;
  }

  const Bitboard81 target = evasionTarget(pos);
  MoveList moves;

  walkPawns(pos, target, moves);
  if (anyEscape(pos, moves)) return false;
  for (PieceKind k : EVASION_KINDS) {
    moves.clear();
    walkPieces(pos, target, k, moves);
    if (anyEscape(pos, moves)) return false;
  }
  moves.clear();
  drops(pos, target & dropTarget, moves);
  return !anyEscape(pos, moves);
}

Bitboard81 naitouDropTarget(const Position& pos) {
  assert(pos.sideToMove() == HUM);
  return pos.blanks() & tables().kingEffect[pos.kingSq(HUM)];
}

} // namespace

void generateMoves(const Position& pos, MoveList& out) {
  out.clear();
  const Bitboard81 target = ~pos.occupiedBy(pos.sideToMove());
  walkPawns(pos, target, out);
  for (PieceKind k : WALK_KINDS) walkPieces(pos, target, k, out);
  drops(pos, pos.blanks(), out);
}

void generateEvasions(const Position& pos, MoveList& out) {
  out.clear();
  evasions(pos, pos.blanks(), out);
}

void generateCaptures(const Position& pos, MoveList& out) {
  out.clear();
  const Bitboard81 target = pos.occupiedBy(other(pos.sideToMove()));
  walkPawns(pos, target, out);
  for (PieceKind k : WALK_KINDS) walkPieces(pos, target, k, out);
}

bool isCheckmated(Position& pos) {
  return isCheckmatedImpl(pos, pos.blanks());
}

bool isCheckmatedNaitou(Position& pos) {
  return isCheckmatedImpl(pos, naitouDropTarget(pos));
}

} // namespace naitou
