#include "naitou/perft.hpp"

#include <chrono>
#include <optional>

#include "naitou/movegen.hpp"

namespace naitou {

namespace {

void generateFor(const Position& pos, bool checked, MoveList& moves) {
  if (checked) generateEvasions(pos, moves);
  else generateMoves(pos, moves);
}

// pos may be illegal on entry: the previous move can be a suicide or a
// pawn-drop mate.
void perftNode(Position& pos, const std::optional<UndoableMove>& last, int depth, PerftStats& st) {
  const Side us = pos.sideToMove();
  if (pos.isChecked(other(us))) return;

  const bool checked = pos.isChecked(us);

  if (depth > 0) {
    MoveList moves;
    generateFor(pos, checked, moves);
    for (const Move& m : moves) {
      const UndoableMove u = pos.doMove(m);
      perftNode(pos, u, depth - 1, st);
      pos.undoMove(u);
    }
    return;
  }

  const bool mated = checked && isCheckmated(pos);
  if (mated && last && last->move.drop && last->move.dropKind() == PAWN) return;

  ++st.nodes;
  if (last && !last->move.drop) {
    if (last->isCapture()) ++st.captures;
    if (last->move.promo) ++st.promotions;
  }
  if (checked) ++st.checks;
  if (mated) ++st.mates;
}

} // namespace

PerftStats& PerftStats::operator+=(const PerftStats& o) {
  nodes += o.nodes;
  captures += o.captures;
  promotions += o.promotions;
  checks += o.checks;
  mates += o.mates;
  return *this;
}

PerftStats perft(Position& pos, int depth) {
  PerftStats st;
  perftNode(pos, std::nullopt, depth, st);
  return st;
}

std::vector<std::pair<Move, PerftStats>> perftDivide(Position& pos, int depth) {
  std::vector<std::pair<Move, PerftStats>> out;
  if (depth <= 0) return out;
  if (pos.isChecked(other(pos.sideToMove()))) return out;

  MoveList moves;
  generateFor(pos, pos.isChecked(pos.sideToMove()), moves);
  out.reserve(moves.size);

  for (const Move& m : moves) {
    PerftStats st;
    const UndoableMove u = pos.doMove(m);
    perftNode(pos, u, depth - 1, st);
    pos.undoMove(u);
    if (st.nodes > 0) out.push_back({m, st});
  }
  return out;
}

PerftStats perftTimed(Position& pos, int depth) {
  const auto t0 = std::chrono::steady_clock::now();
  PerftStats st = perft(pos, depth);
  const auto t1 = std::chrono::steady_clock::now();

  const std::chrono::duration<double> dt = t1 - t0;
  st.seconds = dt.count();
  st.nps = (st.seconds > 0.0) ? (static_cast<double>(st.nodes) / st.seconds) : 0.0;
  return st;
}

std::uint64_t countCaptureLeaves(Position& pos, int depth) {
  const Side us = pos.sideToMove();
  if (pos.isChecked(other(us))) return 0;
  if (depth <= 0) return 1;

  MoveList moves;
  if (depth == 1) generateCaptures(pos, moves);
  else generateFor(pos, pos.isChecked(us), moves);

  std::uint64_t n = 0;
  for (const Move& m : moves) {
    const UndoableMove u = pos.doMove(m);
    n += countCaptureLeaves(pos, depth - 1);
    pos.undoMove(u);
  }
  return n;
}

} // namespace naitou
