#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include "naitou/move.hpp"
#include "naitou/position.hpp"

namespace naitou {

// Leaf counts of a perft run. Captures and promotions count the last move
// when it is a walk; checks and mates describe the leaf position.
struct PerftStats {
  std::uint64_t nodes = 0;
  std::uint64_t captures = 0;
  std::uint64_t promotions = 0;
  std::uint64_t checks = 0;
  std::uint64_t mates = 0;
  double seconds = 0.0;
  double nps = 0.0;

  PerftStats& operator+=(const PerftStats& o);
};

// Counts legal positions at depth. Pawn-drop mates are excluded at the
// leaves only; repetitions and pawn-drop stalemates count as legal.
[[nodiscard]] PerftStats perft(Position& pos, int depth);
[[nodiscard]] std::vector<std::pair<Move, PerftStats>> perftDivide(Position& pos, int depth);
[[nodiscard]] PerftStats perftTimed(Position& pos, int depth);

// Perft whose last ply only plays captures; checks generateCaptures.
[[nodiscard]] std::uint64_t countCaptureLeaves(Position& pos, int depth);

} // namespace naitou
