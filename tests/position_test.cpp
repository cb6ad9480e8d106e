#include <cassert>
#include <iostream>
#include <vector>

#include "naitou/bitboard81.hpp"
#include "naitou/movegen.hpp"
#include "naitou/position.hpp"
#include "naitou/sfen.hpp"

using namespace naitou;

static bool sameEffects(const Position& pos) {
  const Position fresh(pos.sideToMove(), pos.board(), pos.hands());
  return fresh.effectCounts(HUM) == pos.effectCounts(HUM) && fresh.effectCounts(COM) == pos.effectCounts(COM) &&
         fresh.rangedEffects() == pos.rangedEffects() && fresh.comNonkingCount() == pos.comNonkingCount();
}

// Walks every line up to depth, checking incremental effects against a
// rebuild while checkDepth allows and undo equality everywhere.
static void walkTree(Position& pos, int depth, int checkDepth) {
  if (depth == 0) return;
  MoveList moves;
  generateMoves(pos, moves);
  for (const Move& m : moves) {
    const Position before = pos;
    const Side us = pos.sideToMove();
    const UndoableMove u = pos.doMove(m);
    if (checkDepth > 0) assert(sameEffects(pos));
    if (!pos.isChecked(us)) walkTree(pos, depth - 1, checkDepth - 1);
    pos.undoMove(u);
    assert(pos == before);
  }
}

static std::vector<Move> legalMoves(Position& pos) {
  MoveList moves;
  if (pos.isChecked(pos.sideToMove())) generateEvasions(pos, moves);
  else generateMoves(pos, moves);

  std::vector<Move> out;
  const Side us = pos.sideToMove();
  for (const Move& m : moves) {
    const UndoableMove u = pos.doMove(m);
    if (!pos.isChecked(us)) out.push_back(m);
    pos.undoMove(u);
  }
  return out;
}

int main() {
  // Square sets across the split between files 7 and 8
  {
    const std::uint8_t lastLow = sqAt(7, 9);
    const std::uint8_t firstHigh = sqAt(8, 1);
    assert(firstHigh == lastLow + 1);

    Bitboard81 bb = Bitboard81::of(firstHigh) | Bitboard81::of(lastLow) | Bitboard81::of(sqAt(9, 9));
    assert(bb.popcount() == 3);
    assert(bb.test(lastLow) && bb.test(firstHigh) && !bb.test(sqAt(8, 2)));
    assert(!bb.test(SQ_NONE));
    bb.set(SQ_NONE);
    assert(bb.popcount() == 3);

    assert(bb.pop_lsb() == lastLow);
    assert(bb.pop_lsb() == firstHigh);
    assert(bb.pop_lsb() == sqAt(9, 9));
    assert(bb.empty());

    assert(Bitboard81::all().popcount() == SQ_N);
    assert(~Bitboard81{} == Bitboard81::all());
    assert((~Bitboard81::of(firstHigh)).popcount() == SQ_N - 1);
    assert(Bitboard81::all().andNot(Bitboard81::of(lastLow)) == ~Bitboard81::of(lastLow));

    Bitboard81 t;
    t.toggle(firstHigh);
    t.toggle(sqAt(1, 1));
    assert(t == (Bitboard81::of(firstHigh) ^ Bitboard81::of(sqAt(1, 1))));
    t.toggle(firstHigh);
    t.reset(sqAt(1, 1));
    assert(t.empty());
  }

  // Even position basics
  {
    const Position pos = Position::even();
    assert(pos.sideToMove() == HUM);
    assert(pos.ply() == 1);
    assert(pos.kingSq(HUM) == sqAt(5, 9));
    assert(pos.kingSq(COM) == sqAt(5, 1));
    assert(pos.comNonkingCount() == 19);
    assert(!pos.isChecked(HUM));
    assert(!pos.isChecked(COM));
    assert(pos.effectCount(HUM, sqAt(5, 5)) == 0);
    assert(pos.effectCount(COM, sqAt(5, 5)) == 0);
    assert(pos.effectCount(HUM, sqAt(7, 6)) >= 1);
    assert(pos.effectCount(COM, sqAt(3, 4)) >= 1);
    assert(pos.at(sqAt(2, 8)) == makePiece(HUM, ROOK));
    assert(pos.at(sqAt(8, 2)) == makePiece(COM, ROOK));
    assert(pos == Position(HUM, evenBoard(), Hands{}));
    assert(sameEffects(pos));
  }

  // Capture moves the piece into the hand unpromoted and undo restores it
  {
    Position pos = decodeSfen("sfen 4k4/9/4p4/9/4R4/9/9/9/4K4 b - 1").position();
    const std::uint32_t before = pos.comNonkingCount();
    const UndoableMove u = pos.doMove(Move::walk(sqAt(5, 5), sqAt(5, 3), true));
    assert(u.isCapture());
    assert(pos.hand(HUM, PAWN) == 1);
    assert(pos.at(sqAt(5, 3)) == makePiece(HUM, DRAGON));
    assert(pos.comNonkingCount() == before - 1);
    assert(pos.isChecked(COM));
    assert(sameEffects(pos));
    pos.undoMove(u);
    assert(pos.hand(HUM, PAWN) == 0);
    assert(pos.at(sqAt(5, 5)) == makePiece(HUM, ROOK));
    assert(pos.at(sqAt(5, 3)) == makePiece(COM, PAWN));
    assert(pos.comNonkingCount() == before);
  }

  // Drops take from the hand and block ranged effects
  {
    Position pos = decodeSfen("sfen 4k4/9/9/9/9/9/9/9/4K4 w r 1").position();
    assert(pos.effectCount(COM, sqAt(5, 9)) == 0);
    const UndoableMove u = pos.doMove(Move::dropOf(ROOK, sqAt(5, 5)));
    assert(pos.hand(COM, ROOK) == 0);
    assert(pos.comNonkingCount() == 1);
    assert(pos.isChecked(HUM));
    assert(sameEffects(pos));
    pos.undoMove(u);
    assert(pos.hand(COM, ROOK) == 1);
    assert(pos.comNonkingCount() == 1);
    assert(!pos.isChecked(HUM));
  }

  // Incremental effects match a rebuild over every line of the tree
  {
    Position pos = Position::even();
    walkTree(pos, 3, 2);
    assert(pos == Position::even());

    Position busy = decodeSfen("sfen R8/2K1S1SSk/4B4/9/9/9/9/9/1L1L1L3 b RBGSNLP3g3n17p 1").position();
    const Position busyStart = busy;
    walkTree(busy, 2, 2);
    assert(busy == busyStart);
  }

  // A long deterministic game keeps effects consistent and unwinds cleanly
  {
    Position pos = Position::even();
    std::vector<UndoableMove> played;
    for (int i = 0; i < 120; ++i) {
      std::vector<Move> legal = legalMoves(pos);
      if (legal.empty()) break;

      // Captures first so hands fill up and drops show up later.
      const Move* pick = nullptr;
      for (const Move& m : legal) {
        if (!m.drop && pos.at(m.dst) != NO_PIECE) {
          pick = &m;
          break;
        }
      }
      if (!pick) pick = &legal[(static_cast<std::size_t>(i) * 7) % legal.size()];

      const Side us = pos.sideToMove();
      played.push_back(pos.doMove(*pick));
      assert(!pos.isChecked(us));
      assert(sameEffects(pos));
    }
    while (!played.empty()) {
      pos.undoMove(played.back());
      played.pop_back();
    }
    assert(pos == Position::even());
  }

  std::cout << "position_test passed\n";
  return 0;
}
