#include "naitou/solver.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <thread>
#include <utility>

#include "naitou/movegen.hpp"
#include "naitou/sfen.hpp"

namespace naitou {

namespace {

class Worker {
public:
  Worker(const ReplayedGame& game, const SolverConfig& config, int id, int threads, int splitRemaining,
         SolutionSink& sink)
      : engine_(game.engine),
        history_(game.history),
        start_(game.start),
        extinction_(config.extinction),
        id_(id),
        threads_(threads),
        splitRemaining_(splitRemaining),
        counter_(threads - 1),
        sink_(sink) {
    engine_.setTrace(nullptr);
  }

  void search(int depth) {
    const Position& pos = engine_.position();
    const int comPieces = static_cast<int>(pos.comNonkingCount());

    // Each HUM move captures at most one COM piece.
    if (extinction_ && depth < comPieces) return;

    if (depth == splitRemaining_) {
      counter_ = (counter_ + 1) % threads_;
      if (counter_ != id_) return;
    }
    if (depth <= 0) return;

    MoveList moves;
    if (extinction_ && depth == comPieces) generateCaptures(pos, moves);
    else if (pos.isChecked(HUM)) generateEvasions(pos, moves);
    else generateMoves(pos, moves);

    const bool owned = depth <= splitRemaining_ || id_ == 0;
    if (owned) nodes_ += moves.size;

    for (const Move& m : moves) {
      const std::optional<EngineResponse> resp = engine_.tryStep(m);
      if (!resp) continue;

      switch (resp->kind) {
        case EngineResponse::Kind::Move:
          if (!resp->comWins) {
            history_.push_back(m);
            history_.push_back(resp->comMove.move);
            search(depth - 1);
            history_.resize(history_.size() - 2);
          }
          break;
        case EngineResponse::Kind::HumWin:
          if (isWin() && owned) {
            history_.push_back(m);
            sink_.add(encodeSfen(start_.sideToMove, start_.board, start_.hands, history_));
            history_.pop_back();
          }
          break;
        case EngineResponse::Kind::HumSuicide:
          break;
      }
      engine_.undoStep(*resp);
    }
  }

  [[nodiscard]] std::uint64_t nodes() const { return nodes_; }

private:
  Engine engine_;
  std::vector<Move> history_;
  SfenGame start_;
  bool extinction_;
  int id_;
  int threads_;
  int splitRemaining_;
  int counter_;
  std::uint64_t nodes_ = 0;
  SolutionSink& sink_;

  [[nodiscard]] bool isWin() const { return !extinction_ || engine_.position().comNonkingCount() == 0; }
};

bool isPseudoLegal(const Position& pos, const Move& m) {
  MoveList moves;
  generateMoves(pos, moves);
  return std::find(moves.begin(), moves.end(), m) != moves.end();
}

// Plays the record's moves from index `first` on, HUM and COM alternating.
void replayMoves(ReplayedGame& game, std::size_t first) {
  const std::vector<Move>& moves = game.history;
  for (std::size_t i = first; i < moves.size(); i += 2) {
    const Move& hum = moves[i];
    const std::optional<EngineResponse> resp =
        isPseudoLegal(game.engine.position(), hum) ? game.engine.tryStep(hum) : std::nullopt;
    if (!resp) {
      throw std::runtime_error("illegal HUM move " + moveToString(hum) + " in position\n" +
                               game.engine.position().pretty());
    }
    if (resp->kind != EngineResponse::Kind::Move || resp->comWins) {
      throw std::runtime_error("unexpected game end after " + moveToString(hum));
    }
    if (i + 1 >= moves.size()) throw std::runtime_error("game record lacks COM's reply to " + moveToString(hum));
    if (moves[i + 1] != resp->comMove.move) {
      throw std::runtime_error("COM move " + moveToString(moves[i + 1]) + " differs from the replica's " +
                               moveToString(resp->comMove.move));
    }
  }
}

SfenGame withoutMoves(SfenGame game) {
  game.moves.clear();
  return game;
}

} // namespace

ReplayedGame replayGame(std::string_view sfen, bool timelimit) {
  const SfenGame game = decodeSfen(sfen);
  const std::optional<Handicap> handicap = handicapFromStart(game.sideToMove, game.board, game.hands, timelimit);
  if (!handicap) throw std::runtime_error("no handicap matches the start position");

  ReplayedGame out{*handicap, withoutMoves(game), Engine(*handicap), game.moves};

  std::size_t first = 0;
  if (const std::optional<UndoableMove> com = out.engine.firstComMove()) {
    if (game.moves.empty()) throw std::runtime_error("game record lacks COM's first move");
    if (game.moves[0] != com->move) {
      throw std::runtime_error("COM's first move differs from the replica: " + moveToString(game.moves[0]) +
                               " (replica plays " + moveToString(com->move) + ")");
    }
    first = 1;
  }
  replayMoves(out, first);
  return out;
}

ReplayedGame replaySetup(std::string_view sfen, Handicap handicap) {
  const SfenGame game = decodeSfen(sfen);
  ReplayedGame out{handicap, withoutMoves(game), Engine(handicap, game.position()), game.moves};
  replayMoves(out, 0);
  return out;
}

int resolveThreadCount(int requested) {
  if (requested > 0) return requested;
  const int hw = static_cast<int>(std::thread::hardware_concurrency());
  return (hw > 0) ? hw : 1;
}

int resolveBranchDepth(int requested, int depth) {
  const int b = (requested > 0) ? requested : (depth + 1) / 2;
  if (b > depth) throw std::runtime_error("branch depth exceeds search depth");
  return b;
}

void SolutionSink::add(std::string line) {
  std::lock_guard<std::mutex> lk(mu_);
  if (echo_) *echo_ << line << "\n" << std::flush;
  lines_.push_back(std::move(line));
}

std::vector<std::string> SolutionSink::lines() const {
  std::lock_guard<std::mutex> lk(mu_);
  return lines_;
}

std::size_t SolutionSink::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return lines_.size();
}

SolveStats solve(const ReplayedGame& game, const SolverConfig& config, SolutionSink& sink) {
  SolveStats stats;
  if (config.depth < 1) return stats;
  if (game.engine.position().sideToMove() != HUM) throw std::runtime_error("the game must stand with HUM to move");

  const int threads = resolveThreadCount(config.threadCount);
  const int splitRemaining = config.depth - resolveBranchDepth(config.branchDepth, config.depth);

  std::vector<std::exception_ptr> errors(static_cast<std::size_t>(threads));
  std::vector<std::uint64_t> nodes(static_cast<std::size_t>(threads), 0);
  std::vector<std::thread> pool;
  pool.reserve(static_cast<std::size_t>(threads));
  for (int t = 0; t < threads; ++t) {
    pool.emplace_back([&, t]() {
      try {
        Worker w(game, config, t, threads, splitRemaining, sink);
        w.search(config.depth);
        nodes[static_cast<std::size_t>(t)] = w.nodes();
      } catch (...) {
        errors[static_cast<std::size_t>(t)] = std::current_exception();
      }
    });
  }
  for (auto& th : pool) th.join();

  for (const auto& e : errors) {
    if (e) std::rethrow_exception(e);
  }
  for (const std::uint64_t n : nodes) stats.nodes += n;
  return stats;
}

} // namespace naitou
