#include <algorithm>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "naitou/handicap.hpp"
#include "naitou/movegen.hpp"
#include "naitou/sfen.hpp"
#include "naitou/solver.hpp"

using namespace naitou;

namespace {

// COM king on 1a, HUM silver on 2c: a gold dropped on 1b or 2b mates.
const char* MATE_IN_ONE = "sfen 8k/9/7S1/9/9/9/9/9/4K4 b G 1";
// COM keeps one pawn on 1b; taking it with the gold or the silver mates.
const char* KING_AND_PAWN = "sfen 8k/8p/7SG/9/9/9/9/9/4K4 b - 1";
// As above with a second COM pawn out of reach on 9c.
const char* KING_AND_TWO_PAWNS = "sfen 8k/8p/p6SG/9/9/9/9/9/4K4 b - 1";

struct Reference {
  std::vector<std::string> lines;
  std::uint64_t nodes = 0;
};

// Plain serial search without pruning or work splitting.
void referenceSearch(Engine& engine, const SfenGame& start, std::vector<Move>& history, int depth, bool extinction,
                     Reference& out) {
  if (depth == 0) return;
  MoveList moves;
  if (engine.position().isChecked(HUM)) generateEvasions(engine.position(), moves);
  else generateMoves(engine.position(), moves);
  out.nodes += moves.size;

  for (const Move& m : moves) {
    const std::optional<EngineResponse> resp = engine.tryStep(m);
    if (!resp) continue;
    if (resp->kind == EngineResponse::Kind::Move && !resp->comWins) {
      history.push_back(m);
      history.push_back(resp->comMove.move);
      referenceSearch(engine, start, history, depth - 1, extinction, out);
      history.resize(history.size() - 2);
    } else if (resp->kind == EngineResponse::Kind::HumWin) {
      if (!extinction || engine.position().comNonkingCount() == 0) {
        history.push_back(m);
        out.lines.push_back(encodeSfen(start.sideToMove, start.board, start.hands, history));
        history.pop_back();
      }
    }
    engine.undoStep(*resp);
  }
}

Reference reference(const ReplayedGame& game, int depth, bool extinction) {
  Engine engine = game.engine;
  std::vector<Move> history = game.history;
  Reference out;
  referenceSearch(engine, game.start, history, depth, extinction, out);
  std::sort(out.lines.begin(), out.lines.end());
  return out;
}

struct Solved {
  std::vector<std::string> lines;
  std::uint64_t nodes = 0;
};

Solved solved(const ReplayedGame& game, int depth, int threads, int branchDepth, bool extinction) {
  SolverConfig config;
  config.depth = depth;
  config.threadCount = threads;
  config.branchDepth = branchDepth;
  config.extinction = extinction;
  SolutionSink sink;
  const SolveStats stats = solve(game, config, sink);
  Solved out{sink.lines(), stats.nodes};
  std::sort(out.lines.begin(), out.lines.end());
  return out;
}

// The game's history followed by the given moves.
std::string lineOf(const ReplayedGame& game, const std::vector<Move>& tail) {
  std::vector<Move> moves = game.history;
  moves.insert(moves.end(), tail.begin(), tail.end());
  return encodeSfen(game.start.sideToMove, game.start.board, game.start.hands, moves);
}

bool contains(const std::vector<std::string>& lines, const std::string& line) {
  return std::find(lines.begin(), lines.end(), line) != lines.end();
}

// The line replays against the replica from the game's position and its last
// HUM move makes COM resign. With extinction COM must also be left bare.
bool endsInHumWin(const ReplayedGame& game, const std::string& line, bool extinction) {
  const std::vector<Move> moves = decodeSfen(line).moves;
  if (moves.size() <= game.history.size()) return false;
  Engine engine = game.engine;
  for (std::size_t i = game.history.size(); i + 1 < moves.size(); i += 2) {
    const std::optional<EngineResponse> resp = engine.tryStep(moves[i]);
    if (!resp || !resp->hasComMove() || resp->comWins || resp->comMove.move != moves[i + 1]) return false;
  }
  const std::optional<EngineResponse> resp = engine.tryStep(moves.back());
  if (!resp || resp->kind != EngineResponse::Kind::HumWin) return false;
  return !extinction || engine.position().comNonkingCount() == 0;
}

bool replayFails(const std::string& sfen) {
  try {
    (void)replayGame(sfen, false);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

} // namespace

int main() {
  // Depth and thread settings
  {
    assert(resolveThreadCount(4) == 4);
    assert(resolveThreadCount(0) >= 1);
    assert(resolveBranchDepth(0, 5) == 3);
    assert(resolveBranchDepth(0, 1) == 1);
    assert(resolveBranchDepth(2, 2) == 2);
    bool threw = false;
    try {
      (void)resolveBranchDepth(3, 2);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw);
  }

  // Replaying game records
  {
    const ReplayedGame even = replayGame("startpos", false);
    assert(even.handicap == Handicap::HumSenteSikenbisha);
    assert(even.history.empty());
    assert(replayGame("startpos", true).handicap == Handicap::HumSenteNakabisha);

    Engine engine(Handicap::ComSenteNakabisha);
    std::vector<Move> record = {engine.firstComMove()->move};
    for (int i = 0; i < 4; ++i) {
      MoveList moves;
      generateMoves(engine.position(), moves);
      for (const Move& m : moves) {
        const std::optional<EngineResponse> resp = engine.tryStep(m);
        if (!resp) continue;
        if (resp->hasComMove() && !resp->comWins) {
          record.push_back(m);
          record.push_back(resp->comMove.move);
          break;
        }
        engine.undoStep(*resp);
      }
    }
    assert(record.size() == 9);

    const SfenGame start = handicapStart(Handicap::ComSenteNakabisha);
    const std::string sfen = encodeSfen(start.sideToMove, start.board, start.hands, record);
    const ReplayedGame replayed = replayGame(sfen, true);
    assert(replayed.handicap == Handicap::ComSenteNakabisha);
    assert(replayed.history == record);
    assert(replayed.engine.sameState(engine));

    std::vector<Move> wrongReply = record;
    std::swap(wrongReply[2], wrongReply[4]);
    assert(replayFails(encodeSfen(start.sideToMove, start.board, start.hands, wrongReply)));

    std::vector<Move> noReply(record.begin(), record.end() - 1);
    assert(replayFails(encodeSfen(start.sideToMove, start.board, start.hands, noReply)));

    assert(replayFails("sfen 4k4/9/9/9/9/9/9/9/4K4 b - 1"));
    assert(replayFails("startpos moves 7g7e 3c3d"));
    assert(replayFails("startpos moves 5i5i 3c3d"));
  }

  // Set-up positions replay like game records
  {
    const ReplayedGame game = replaySetup(MATE_IN_ONE, Handicap::HumSenteSikenbisha);
    assert(game.history.empty());
    assert(encodeSfenPosition(game.start.sideToMove, game.start.board, game.start.hands) == MATE_IN_ONE);
    assert(game.engine.position() == decodeSfen(MATE_IN_ONE).position());

    bool threw = false;
    try {
      (void)replaySetup("sfen 8k/9/7S1/9/9/9/9/9/4K4 w G 1", Handicap::HumSenteSikenbisha);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw);
  }

  // A known mate is found, alone at depth 1 and among longer lines at depth 2
  {
    const ReplayedGame game = replaySetup(MATE_IN_ONE, Handicap::HumSenteSikenbisha);
    const std::string goldMate = lineOf(game, {Move::dropOf(GOLD, sqAt(1, 2))});
    assert(endsInHumWin(game, goldMate, false));

    const Reference one = reference(game, 1, false);
    assert(contains(one.lines, goldMate));
    for (const std::string& line : one.lines) assert(decodeSfen(line).moves.size() == 1);
    assert(solved(game, 1, 1, 0, false).lines == one.lines);

    const Reference two = reference(game, 2, false);
    assert(two.lines.size() > one.lines.size());
    assert(contains(two.lines, goldMate));
    for (const std::string& line : two.lines) assert(endsInHumWin(game, line, false));
  }

  // Results and work do not depend on the thread count or the split depth
  {
    const ReplayedGame game = replaySetup(MATE_IN_ONE, Handicap::HumSenteSikenbisha);
    const Reference expected = reference(game, 2, false);
    assert(!expected.lines.empty());
    for (int threads : {1, 2, 3, 8}) {
      for (int branchDepth : {1, 2}) {
        const Solved got = solved(game, 2, threads, branchDepth, false);
        assert(got.lines == expected.lines);
        assert(got.nodes == expected.nodes);
      }
    }

    const ReplayedGame pawn = replaySetup(KING_AND_PAWN, Handicap::HumSenteSikenbisha);
    const Reference deep = reference(pawn, 3, false);
    assert(!deep.lines.empty());
    for (int threads : {1, 2, 8}) {
      for (int branchDepth : {1, 2, 3}) {
        const Solved got = solved(pawn, 3, threads, branchDepth, false);
        assert(got.lines == deep.lines);
        assert(got.nodes == deep.nodes);
      }
    }

    const ReplayedGame even = replayGame("startpos", false);
    const Reference none = reference(even, 2, false);
    assert(none.lines.empty());
    assert(solved(even, 2, 3, 1, false).lines.empty());
    assert(solved(even, 2, 8, 2, false).nodes == none.nodes);

    const SfenGame start = handicapStart(Handicap::ComNimaiochi);
    const Move opening = Engine(Handicap::ComNimaiochi).firstComMove()->move;
    const ReplayedGame nimaiochi = replayGame(encodeSfen(start.sideToMove, start.board, start.hands, {opening}), false);
    assert(nimaiochi.handicap == Handicap::ComNimaiochi);
    assert(solved(nimaiochi, 2, 4, 1, false).lines == reference(nimaiochi, 2, false).lines);
  }

  // King and one pawn under extinction: nothing below depth 1, captures only at depth 1
  {
    const ReplayedGame game = replaySetup(KING_AND_PAWN, Handicap::HumSenteSikenbisha);
    assert(game.engine.position().comNonkingCount() == 1);

    const Solved zero = solved(game, 0, 2, 0, true);
    assert(zero.lines.empty());
    assert(zero.nodes == 0);

    MoveList all;
    MoveList captures;
    generateMoves(game.engine.position(), all);
    generateCaptures(game.engine.position(), captures);
    assert(captures.size > 0 && captures.size < all.size);

    const Solved one = solved(game, 1, 1, 0, true);
    assert(one.nodes == captures.size);
    const std::string goldTakes = lineOf(game, {Move::walk(sqAt(1, 3), sqAt(1, 2))});
    assert(contains(one.lines, goldTakes));
    for (const std::string& line : one.lines) {
      assert(endsInHumWin(game, line, true));
      const Move last = decodeSfen(line).moves.back();
      assert(!last.drop && last.dst == sqAt(1, 2));
    }
    assert(one.lines == reference(game, 1, true).lines);
  }

  // Extinction pruning never loses a line the unpruned search finds
  {
    const ReplayedGame pawn = replaySetup(KING_AND_PAWN, Handicap::HumSenteSikenbisha);
    for (int depth : {2, 3}) {
      const Reference expected = reference(pawn, depth, true);
      assert(!expected.lines.empty());
      for (int threads : {1, 2, 8}) {
        const Solved got = solved(pawn, depth, threads, 0, true);
        assert(got.lines == expected.lines);
        assert(got.nodes <= expected.nodes);
      }
    }

    // Two pawns cannot both be taken in one move, even though COM resigns.
    const ReplayedGame twoPawns = replaySetup(KING_AND_TWO_PAWNS, Handicap::HumSenteSikenbisha);
    assert(twoPawns.engine.position().comNonkingCount() == 2);
    const Solved cut = solved(twoPawns, 1, 2, 0, true);
    assert(cut.lines.empty());
    assert(cut.nodes == 0);
    assert(contains(solved(twoPawns, 1, 2, 0, false).lines, lineOf(twoPawns, {Move::walk(sqAt(1, 3), sqAt(1, 2))})));
    assert(solved(twoPawns, 2, 2, 1, true).lines == reference(twoPawns, 2, true).lines);
  }

  // Depth zero finds nothing
  {
    const ReplayedGame game = replayGame("startpos", false);
    assert(solved(game, 0, 2, 0, false).lines.empty());
  }

  // Solutions are echoed as they are found
  {
    std::ostringstream oss;
    SolutionSink sink(&oss);
    sink.add("startpos moves 7g7f");
    sink.add("startpos moves 2g2f");
    assert(sink.size() == 2);
    assert(oss.str() == "startpos moves 7g7f\nstartpos moves 2g2f\n");
    assert(sink.lines().front() == "startpos moves 7g7f");
  }

  std::cout << "solver_test passed\n";
  return 0;
}
