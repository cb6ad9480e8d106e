#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "naitou/engine.hpp"
#include "naitou/handicap.hpp"
#include "naitou/movegen.hpp"
#include "naitou/perft.hpp"
#include "naitou/sfen.hpp"
#include "naitou/solver.hpp"
#include "naitou/trace.hpp"

using naitou::Engine;
using naitou::EngineResponse;
using naitou::Move;
using naitou::MoveList;
using naitou::Position;

static void usage(std::string_view exe) {
  std::cerr << "Usage:\n"
            << "  " << exe << " solve <sfen> <depth> [--timelimit | --setup <handicap>] [--threads N]\n"
            << "        [--branch-depth N] [--extinct]\n"
            << "  " << exe << " solve-extinct <sfen> <depth> [--timelimit | --setup <handicap>] [--threads N]\n"
            << "        [--branch-depth N]\n"
            << "  " << exe << " perft <depth> [--sfen <sfen>] [--divide]\n"
            << "  " << exe << " trace <sfen> [--timelimit] [--brief]\n"
            << "  " << exe << " play [--handicap <name>] [--trace]\n"
            << "Handicaps:";
  for (int h = 0; h <= static_cast<int>(naitou::Handicap::ComNimaiochi); ++h) {
    std::cerr << " " << naitou::handicapName(static_cast<naitou::Handicap>(h));
  }
  std::cerr << "\n";
}

static std::optional<std::string> argValue(int argc, char** argv, std::string_view key) {
  for (int i = 1; i + 1 < argc; ++i) {
    if (std::string_view(argv[i]) == key) return std::string(argv[i + 1]);
  }
  return std::nullopt;
}

static bool hasFlag(int argc, char** argv, std::string_view key) {
  for (int i = 1; i < argc; ++i) {
    if (std::string_view(argv[i]) == key) return true;
  }
  return false;
}

static int intArg(int argc, char** argv, std::string_view key, int def) {
  if (auto v = argValue(argc, argv, key)) return std::atoi(v->c_str());
  return def;
}

static int parseDepth(std::string_view cmd, const char* s) {
  const int depth = std::atoi(s);
  if (depth < 1) throw std::runtime_error(std::string(cmd) + ": depth must be at least 1");
  return depth;
}

// A record from a setup's start position, or with --setup any position
// played against that setup's replica.
static naitou::ReplayedGame replayFromArgs(int argc, char** argv) {
  if (auto v = argValue(argc, argv, "--setup")) {
    const auto h = naitou::parseHandicap(*v);
    if (!h) throw std::runtime_error("unknown handicap '" + *v + "'");
    return naitou::replaySetup(argv[2], *h);
  }
  return naitou::replayGame(argv[2], hasFlag(argc, argv, "--timelimit"));
}

static void cmdSolve(int argc, char** argv, bool extinction) {
  const std::string_view cmd = argv[1];
  if (argc < 4) throw std::runtime_error(std::string(cmd) + ": expected <sfen> <depth>");

  naitou::SolverConfig cfg;
  cfg.depth = parseDepth(cmd, argv[3]);
  cfg.threadCount = naitou::resolveThreadCount(intArg(argc, argv, "--threads", 0));
  cfg.branchDepth = naitou::resolveBranchDepth(intArg(argc, argv, "--branch-depth", 0), cfg.depth);
  cfg.extinction = extinction || hasFlag(argc, argv, "--extinct");

  const naitou::ReplayedGame game = replayFromArgs(argc, argv);

  std::cerr << cmd << ": handicap " << naitou::handicapName(game.handicap) << ", threads " << cfg.threadCount
            << ", branch depth " << cfg.branchDepth << ", depth " << cfg.depth
            << (cfg.extinction ? ", extinction" : "") << "\n";

  naitou::SolutionSink sink(&std::cout);
  const naitou::SolveStats stats = naitou::solve(game, cfg, sink);

  std::cerr << cmd << ": done. " << sink.size() << " solutions, " << stats.nodes << " nodes\n";
}

static void cmdPerft(int argc, char** argv) {
  if (argc < 3) throw std::runtime_error("perft: missing depth");
  const int depth = std::atoi(argv[2]);
  Position pos = naitou::decodeSfen(argValue(argc, argv, "--sfen").value_or("startpos")).position();

  std::cout << pos.pretty() << "\n";

  if (hasFlag(argc, argv, "--divide")) {
    const auto rows = naitou::perftDivide(pos, depth);
    std::uint64_t total = 0;
    for (const auto& [m, st] : rows) {
      std::cout << naitou::moveToString(m) << "  " << st.nodes << "\n";
      total += st.nodes;
    }
    std::cout << "Total: " << total << "\n";
  } else {
    const auto st = naitou::perftTimed(pos, depth);
    std::cout << "Nodes     : " << st.nodes << "\n";
    std::cout << "Captures  : " << st.captures << "\n";
    std::cout << "Promotions: " << st.promotions << "\n";
    std::cout << "Checks    : " << st.checks << "\n";
    std::cout << "Mates     : " << st.mates << "\n";
    std::cout << "Time      : " << st.seconds << " s\n";
    std::cout << "NPS       : " << static_cast<std::uint64_t>(st.nps) << "\n";
  }
}

static std::string responseName(const EngineResponse& r) {
  switch (r.kind) {
    case EngineResponse::Kind::Move: return r.comWins ? "COM wins" : "move";
    case EngineResponse::Kind::HumWin: return "HUM wins";
    case EngineResponse::Kind::HumSuicide: return "HUM suicide";
  }
  return "?";
}

static void cmdTrace(int argc, char** argv) {
  if (argc < 3) throw std::runtime_error("trace: missing <sfen>");
  const naitou::SfenGame game = naitou::decodeSfen(argv[2]);
  const auto handicap =
      naitou::handicapFromStart(game.sideToMove, game.board, game.hands, hasFlag(argc, argv, "--timelimit"));
  if (!handicap) throw std::runtime_error("trace: no handicap matches the start position");

  naitou::TextTrace trace(std::cout, !hasFlag(argc, argv, "--brief"));
  Engine engine(*handicap, &trace);

  std::size_t i = engine.firstComMove() ? 1 : 0;
  for (; i < game.moves.size(); i += 2) {
    const EngineResponse r = engine.doStep(game.moves[i]);
    if (r.kind != EngineResponse::Kind::Move || r.comWins) {
      std::cerr << "trace: game ended (" << responseName(r) << ") after " << naitou::moveToString(game.moves[i])
                << "\n";
      return;
    }
    if (i + 1 < game.moves.size() && game.moves[i + 1] != r.comMove.move) {
      std::cerr << "trace: record has " << naitou::moveToString(game.moves[i + 1]) << ", replica plays "
                << naitou::moveToString(r.comMove.move) << "\n";
      return;
    }
  }
}

// HUM moves that do not leave the HUM king in check.
static std::vector<Move> humMoves(const Position& pos) {
  MoveList moves;
  if (pos.isChecked(naitou::HUM)) naitou::generateEvasions(pos, moves);
  else naitou::generateMoves(pos, moves);

  Position scratch = pos;
  std::vector<Move> out;
  for (const Move& m : moves) {
    const naitou::UndoableMove u = scratch.doMove(m);
    if (!scratch.isChecked(naitou::HUM)) out.push_back(m);
    scratch.undoMove(u);
  }
  return out;
}

static void cmdPlay(int argc, char** argv) {
  naitou::Handicap handicap = naitou::Handicap::HumSenteSikenbisha;
  if (auto v = argValue(argc, argv, "--handicap")) {
    const auto h = naitou::parseHandicap(*v);
    if (!h) throw std::runtime_error("play: unknown handicap '" + *v + "'");
    handicap = *h;
  }

  naitou::TextTrace trace(std::cerr, false);
  Engine engine(handicap, hasFlag(argc, argv, "--trace") ? &trace : nullptr);

  std::vector<Move> history;
  std::vector<EngineResponse> steps;
  if (const auto first = engine.firstComMove()) {
    std::cout << "COM plays: " << naitou::moveToString(first->move) << "\n";
    history.push_back(first->move);
  }

  const naitou::SfenGame start = naitou::handicapStart(handicap);
  for (;;) {
    std::cout << "\n" << engine.position().pretty();
    const std::vector<Move> moves = humMoves(engine.position());
    if (moves.empty()) {
      std::cout << "HUM has no legal move.\n";
      break;
    }

    std::cout << "Move (sfen token, index, 'list', 'undo' or 'q'): ";
    std::string line;
    if (!std::getline(std::cin, line) || line == "q" || line == "quit") break;

    if (line == "list") {
      for (std::size_t i = 0; i < moves.size(); ++i) std::cout << "  [" << i << "] " << naitou::moveToString(moves[i]) << "\n";
      continue;
    }
    if (line == "undo") {
      if (steps.empty()) {
        std::cout << "Nothing to undo.\n";
        continue;
      }
      engine.undoStep(steps.back());
      steps.pop_back();
      history.resize(history.size() - 2);
      continue;
    }

    std::optional<Move> chosen = naitou::parseMoveToken(line);
    if (!chosen && !line.empty() && line.find_first_not_of("0123456789") == std::string::npos) {
      const std::size_t idx = static_cast<std::size_t>(std::atoi(line.c_str()));
      if (idx < moves.size()) chosen = moves[idx];
    }
    bool legal = false;
    for (const Move& m : moves) legal = legal || (chosen && m == *chosen);
    if (!legal) {
      std::cout << "Illegal move.\n";
      continue;
    }

    const EngineResponse r = engine.doStep(*chosen);
    history.push_back(*chosen);
    if (r.kind != EngineResponse::Kind::Move) {
      std::cout << "Game over: " << responseName(r) << "\n";
      break;
    }
    history.push_back(r.comMove.move);
    std::cout << "COM plays: " << naitou::moveToString(r.comMove.move) << "\n";
    if (r.comWins) {
      std::cout << "Game over: " << responseName(r) << "\n";
      break;
    }
    steps.push_back(r);
  }

  std::cout << "\n" << naitou::encodeSfen(start.sideToMove, start.board, start.hands, history) << "\n";
}

int main(int argc, char** argv) {
  try {
    if (argc < 2) {
      usage(argv[0]);
      return 1;
    }
    const std::string_view cmd = argv[1];
    if (cmd == "solve") {
      cmdSolve(argc, argv, false);
      return 0;
    }
    if (cmd == "solve-extinct") {
      cmdSolve(argc, argv, true);
      return 0;
    }
    if (cmd == "perft") {
      cmdPerft(argc, argv);
      return 0;
    }
    if (cmd == "trace") {
      cmdTrace(argc, argv);
      return 0;
    }
    if (cmd == "play") {
      cmdPlay(argc, argv);
      return 0;
    }

    usage(argv[0]);
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
