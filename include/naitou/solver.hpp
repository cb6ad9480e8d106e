#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "naitou/engine.hpp"
#include "naitou/handicap.hpp"
#include "naitou/move.hpp"
#include "naitou/sfen.hpp"

namespace naitou {

// A recorded game replayed against the replica: the engine stands at the
// last position, HUM to move.
struct ReplayedGame {
  Handicap handicap;
  SfenGame start; // position solutions are written from, without moves
  Engine engine;
  std::vector<Move> history; // every move from the start position
};

// Replays the SFEN game. COM's moves in the record must be the ones the
// replica plays; a mismatch, an illegal HUM move or a finished game throws
// std::runtime_error.
[[nodiscard]] ReplayedGame replayGame(std::string_view sfen, bool timelimit);

// As replayGame, but the SFEN position is any position with HUM to move and
// the replica plays COM as in a game of the given setup (see the set-up
// Engine constructor).
[[nodiscard]] ReplayedGame replaySetup(std::string_view sfen, Handicap handicap);

struct SolverConfig {
  int depth = 1;       // HUM moves to search
  int threadCount = 0; // 0 = hardware concurrency
  int branchDepth = 0; // HUM moves played before splitting, 0 = ceil(depth / 2)
  bool extinction = false;
};

[[nodiscard]] int resolveThreadCount(int requested);
[[nodiscard]] int resolveBranchDepth(int requested, int depth);

// Append-only collector shared by the workers.
class SolutionSink {
public:
  explicit SolutionSink(std::ostream* echo = nullptr) : echo_(echo) {}

  void add(std::string line);

  [[nodiscard]] std::vector<std::string> lines() const;
  [[nodiscard]] std::size_t size() const;

private:
  mutable std::mutex mu_;
  std::vector<std::string> lines_;
  std::ostream* echo_;
};

struct SolveStats {
  std::uint64_t nodes = 0; // HUM moves tried, each counted once over all workers
};

// Enumerates every HUM line of at most config.depth moves that wins against
// the replica from the replayed position, writing each as a full SFEN game
// (start position plus all moves) to sink.
//
// Standard wins end with COM resigning. Extinction wins additionally need
// COM to have nothing left but its king; lines that cannot capture the
// remaining COM pieces in time are cut.
//
// Work split: every worker walks the tree down to the split depth. Nodes
// there are numbered in visiting order and worker i finishes those whose
// number mod threadCount is i. Wins above the split are reported by worker 0.
SolveStats solve(const ReplayedGame& game, const SolverConfig& config, SolutionSink& sink);

} // namespace naitou
