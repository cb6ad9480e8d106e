#include "naitou/engine.hpp"

#include <algorithm>
#include <stdexcept>

#include "naitou/movegen.hpp"
#include "naitou/pricing.hpp"
#include "naitou/tables.hpp"
#include "naitou/trace.hpp"

namespace naitou {

Engine::Engine(Handicap handicap, TraceSink* trace)
    : handicap_(handicap),
      pos_(handicapStart(handicap).position()),
      book_(initialFormation(handicap)),
      trace_(trace) {
  if (pos_.sideToMove() == HUM) return;

  const Decision d = think(std::nullopt);
  if (d.kind != Decision::Kind::Move) throw std::runtime_error("COM's opening decision is not a move");
  if (trace_) {
    trace_->response("move", d.best);
    trace_->thinkEnd();
  }
  firstComMove_ = playCom(d.best);
}

Engine::Engine(Handicap handicap, const Position& pos, TraceSink* trace)
    : handicap_(handicap), pos_(pos), book_(initialFormation(handicap)), trace_(trace) {
  if (pos_.sideToMove() != HUM) throw std::runtime_error("set-up position must have HUM to move");
}

std::optional<EngineResponse> Engine::tryStep(const Move& humMove) {
  EngineResponse resp;
  resp.undo.humMove = pos_.doMove(humMove);
  if (pos_.isChecked(HUM)) {
    pos_.undoMove(resp.undo.humMove);
    return std::nullopt;
  }

  resp.undo.progressPly = progressPly_;
  resp.undo.progressLevel = progressLevel_;
  resp.undo.progressLevelSub = progressLevelSub_;
  resp.undo.book = book_;
  resp.undo.bestSrcValue = bestSrcValue_;

  bumpProgressPly();
  if (progressPly_ >= 51) progressLevel_ = static_cast<std::uint8_t>(std::min(progressLevel_ + 1, 2));
  if (progressPly_ >= 71) progressLevel_ = 3;

  const Decision d = think(humMove);
  switch (d.kind) {
    case Decision::Kind::Move:
      resp.kind = EngineResponse::Kind::Move;
      resp.comMove = playCom(d.best);
      resp.comWins = d.humCheckmated;
      if (trace_) trace_->response(d.humCheckmated ? "com-win" : "move", d.best);
      break;
    case Decision::Kind::HumWin:
      resp.kind = EngineResponse::Kind::HumWin;
      if (trace_) trace_->response("hum-win", std::nullopt);
      break;
    case Decision::Kind::HumSuicide:
      resp.kind = EngineResponse::Kind::HumSuicide;
      if (trace_) trace_->response("hum-suicide", std::nullopt);
      break;
  }
  if (trace_) trace_->thinkEnd();
  return resp;
}

EngineResponse Engine::doStep(const Move& humMove) {
  std::optional<EngineResponse> resp = tryStep(humMove);
  if (!resp) throw std::runtime_error("suicide move: " + moveToString(humMove));
  return *resp;
}

void Engine::undoStep(const EngineResponse& resp) {
  if (resp.hasComMove()) pos_.undoMove(resp.comMove);
  pos_.undoMove(resp.undo.humMove);
  progressPly_ = resp.undo.progressPly;
  progressLevel_ = resp.undo.progressLevel;
  progressLevelSub_ = resp.undo.progressLevelSub;
  book_ = resp.undo.book;
  bestSrcValue_ = resp.undo.bestSrcValue;
}

bool Engine::sameState(const Engine& o) const {
  return handicap_ == o.handicap_ && pos_ == o.pos_ && progressPly_ == o.progressPly_ &&
         progressLevel_ == o.progressLevel_ && progressLevelSub_ == o.progressLevelSub_ && book_ == o.book_ &&
         bestSrcValue_ == o.bestSrcValue_;
}

UndoableMove Engine::playCom(const Move& m) {
  const UndoableMove um = pos_.doMove(m);
  bumpProgressPly();
  return um;
}

void Engine::bumpProgressPly() {
  progressPly_ = static_cast<std::uint8_t>(std::min(progressPly_ + 1, 100));
}

Engine::Decision Engine::think(std::optional<Move> humMove) {
  if (trace_) {
    trace_->thinkStart(pos_);
    trace_->progress(progressPly_, progressLevel_, progressLevelSub_);
    trace_->formation(book_.formation());
  }

  const RootEvaluation root = evaluateRoot();
  if (trace_) trace_->rootEvaluation(root);

  const Decision searched = thinkSearch(root);

  auto bookDecision = [](const Move& m) {
    Decision d;
    d.best = m;
    return d;
  };

  // HUM landing on 22, 45 or 56 early in the opening sends COM to the book
  // whatever the search found. This can leave COM's king in check; HUM never
  // plays suicide moves here, so the hole is harmless.
  if (humMove && progressPly_ <= 6 && progressLevel_ == 0) {
    const std::uint8_t dst = humMove->dst;
    if (dst == sqAt(2, 2) || dst == sqAt(4, 5) || dst == sqAt(5, 6)) {
      if (auto m = thinkBook(humMove)) return bookDecision(*m);
      progressLevel_ = 1;
    }
  }

  if (searched.kind == Decision::Kind::Move) {
    if (progressLevel_ == 0 && !searched.quiet) {
      ++progressLevelSub_;
      if (progressLevelSub_ >= 5) progressLevel_ = 1;
    }
    if (progressLevel_ == 0 && searched.quiet && !searched.skipBook) {
      if (auto m = thinkBook(humMove)) return bookDecision(*m);
      progressLevel_ = 1;
    }
  }

  return searched;
}

Engine::Decision Engine::thinkSearch(const RootEvaluation& root) {
  Decision d;

  // COM can take the HUM king.
  if (root.advPrice >= 30) {
    d.kind = Decision::Kind::HumSuicide;
    return d;
  }

  std::optional<Move> best;
  LeafEvaluation bestEval = LeafEvaluation::worst();

  MoveList moves;
  generateMovesCom(pos_, moves);
  for (const Move& m : moves) {
    const UndoableMove um = pos_.doMove(m);
    if (trace_) trace_->candidateStart(pos_, m);

    bool done = false;
    if (std::optional<LeafEvaluation> leaf = evaluateLeaf(root, um)) {
      revise(root, um, *leaf);
      if (trace_) trace_->leafEvaluation("rev", *leaf);

      const bool mates = leaf->humCheckmated;
      if (mates && trace_) trace_->comparison("hum-checkmated", true);
      if (mates || canImproveBest(root, bestEval, *leaf, um)) {
        best = m;
        bestEval = *leaf;
        // Only drops compare against this value, so walks may store 0.
        bestSrcValue_ = m.drop ? comDropSrcValue(m.dropKind()) : 0;
      }
      done = mates;
    }

    if (trace_) {
      trace_->best(best, bestEval);
      trace_->candidateEnd();
    }
    pos_.undoMove(um);
    if (done) break;
  }

  // COM resigns when the best move still loses its king. Recapture
  // corrections can push disadvPrice below the threshold with the king en
  // prise, hence the extra suicide test.
  if (bestEval.disadvPrice >= 31 || bestEval.suicide) {
    d.kind = Decision::Kind::HumWin;
    return d;
  }
  if (!best) throw std::runtime_error("COM accepted no candidate move");

  d.best = *best;
  d.quiet = root.advPrice == 0 && root.disadvPrice == 0 && bestEval.capturePrice == 0;
  d.skipBook = bestEval.scorePosi != bestEval.advPrice && bestEval.scorePosi >= 8;
  d.humCheckmated = bestEval.humCheckmated;
  return d;
}

std::optional<Move> Engine::thinkBook(std::optional<Move> humMove) {
  if (trace_) trace_->bookStart();

  // Rejected candidates are consumed as well.
  while (const std::optional<Move> m = book_.nextMove(pos_, progressPly_)) {
    if (!bookMoveIsLegal(*m)) continue;
    if (pos_.effectCount(HUM, m->dst) >= pos_.effectCount(COM, m->dst)) continue;

    // Early on, after HUM lands on 45, the book move is played even if it
    // loses material.
    const bool afterHum45 = progressPly_ <= 6 && humMove && humMove->dst == sqAt(4, 5);
    if (bookMoveDisadvPrice(*m) > 0 && !afterHum45) continue;

    if (trace_) trace_->bookAccept(*m);
    return m;
  }
  return std::nullopt;
}

// Book moves are plain walks to rank 7 or above.
bool Engine::bookMoveIsLegal(const Move& m) const {
  const Piece dstPc = pos_.at(m.dst);
  if (dstPc != NO_PIECE && pieceSide(dstPc) == COM) return false;

  const Piece srcPc = pos_.at(m.src);
  if (srcPc == NO_PIECE || pieceSide(srcPc) != COM) return false;
  if (!effect(srcPc, m.src, pos_.occupied()).test(m.dst)) return false;

  // Not a full suicide test; material loss is checked afterwards.
  if (srcPc == makePiece(COM, KING) && pos_.effectCount(HUM, m.dst) != 0) return false;
  return true;
}

std::uint8_t Engine::bookMoveDisadvPrice(const Move& m) {
  const UndoableMove um = pos_.doMove(m);
  const std::uint8_t price = disadvantagePrice();
  pos_.undoMove(um);
  return price;
}

} // namespace naitou
