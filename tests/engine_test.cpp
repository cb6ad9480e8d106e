#include <algorithm>
#include <cassert>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "naitou/book.hpp"
#include "naitou/engine.hpp"
#include "naitou/handicap.hpp"
#include "naitou/movegen.hpp"
#include "naitou/sfen.hpp"
#include "naitou/trace.hpp"

using namespace naitou;

namespace {

constexpr Handicap ALL_HANDICAPS[] = {
  Handicap::HumSenteSikenbisha, Handicap::HumSenteNakabisha, Handicap::HumHishaochi, Handicap::HumNimaiochi,
  Handicap::ComSenteSikenbisha, Handicap::ComSenteNakabisha, Handicap::ComHishaochi, Handicap::ComNimaiochi,
};

// HUM moves that keep HUM's king safe.
std::vector<Move> humLegalMoves(const Engine& engine) {
  Position pos = engine.position();
  MoveList moves;
  if (pos.isChecked(HUM)) generateEvasions(pos, moves);
  else generateMoves(pos, moves);

  std::vector<Move> out;
  for (const Move& m : moves) {
    const UndoableMove u = pos.doMove(m);
    if (!pos.isChecked(HUM)) out.push_back(m);
    pos.undoMove(u);
  }
  return out;
}

// Counts calls so the hook order can be checked without parsing text.
class CountingTrace final : public TraceSink {
public:
  int thinks = 0;
  int ends = 0;
  int candidates = 0;
  int candidateEnds = 0;
  int responses = 0;
  int cheaperDrops = 0;
  bool open = false;

  void thinkStart(const Position& pos) override {
    assert(!open);
    assert(pos.sideToMove() == COM);
    open = true;
    ++thinks;
  }
  void progress(int, int, int) override { assert(open); }
  void formation(Formation) override { assert(open); }
  void rootEvaluation(const RootEvaluation&) override { assert(open); }
  void candidateStart(const Position& after, const Move&) override {
    assert(open);
    assert(after.sideToMove() == HUM);
    ++candidates;
  }
  void candidateRejected(std::string_view reason) override { assert(!reason.empty()); }
  void leafEvaluation(std::string_view, const LeafEvaluation&) override { assert(open); }
  void revision(std::string_view rule, const LeafEvaluation&) override { assert(!rule.empty()); }
  void comparison(std::string_view rule, bool improved) override {
    assert(open);
    // A drop that is not cheaper than the best one is dropped silently.
    if (rule == "drop-prefer-cheap") {
      assert(improved);
      ++cheaperDrops;
    }
  }
  void best(std::optional<Move>, const LeafEvaluation&) override { assert(open); }
  void candidateEnd() override { ++candidateEnds; }
  void bookStart() override { assert(open); }
  void bookAccept(const Move&) override { assert(open); }
  void response(std::string_view kind, std::optional<Move> m) override {
    assert(open);
    assert((kind == "move" || kind == "com-win") == m.has_value());
    ++responses;
  }
  void thinkEnd() override {
    assert(open);
    open = false;
    ++ends;
  }
};

} // namespace

int main() {
  // Every handicap starts with HUM to move
  {
    for (Handicap h : ALL_HANDICAPS) {
      const Engine engine(h);
      assert(engine.handicap() == h);
      assert(engine.position().sideToMove() == HUM);
      assert(engine.book().formation() == initialFormation(h));
      assert(engine.progressLevel() == 0);
      if (comMovesFirst(h)) {
        assert(engine.firstComMove().has_value());
        assert(engine.progressPly() == 1);
        assert(engine.position().ply() == 2);
      } else {
        assert(!engine.firstComMove().has_value());
        assert(engine.progressPly() == 0);
        assert(engine.position() == handicapStart(h).position());
      }
    }
  }

  // The two even-game books answer the same position from their own table
  {
    assert(initialFormation(Handicap::HumSenteSikenbisha) == Formation::Sikenbisha);
    assert(initialFormation(Handicap::HumSenteNakabisha) == Formation::Nakabisha);
    assert(formationName(Formation::Nothing) != formationName(Formation::Sikenbisha));
  }

  // Identical input gives identical games, and undo restores the state
  {
    for (Handicap h : ALL_HANDICAPS) {
      Engine a(h);
      Engine b(h);
      std::vector<EngineResponse> played;
      for (int i = 0; i < 24; ++i) {
        const std::vector<Move> legal = humLegalMoves(a);
        if (legal.empty()) break;
        const Move m = legal[(static_cast<std::size_t>(i) * 11 + 3) % legal.size()];

        const Engine before = a;
        const EngineResponse ra = a.doStep(m);
        const EngineResponse rb = b.doStep(m);
        assert(ra.kind == rb.kind);
        assert(ra.comWins == rb.comWins);
        assert(a.sameState(b));
        assert(a.progressPly() >= before.progressPly());

        if (ra.hasComMove()) {
          assert(ra.comMove.move == rb.comMove.move);
          assert(a.position().sideToMove() == HUM);
          assert(a.progressPly() == std::min(before.progressPly() + 2, 100));
        }

        a.undoStep(ra);
        assert(a.sameState(before));
        b.undoStep(rb);

        if (!ra.hasComMove() || ra.comWins) break;
        played.push_back(a.doStep(m));
        b.doStep(m);
      }

      while (!played.empty()) {
        a.undoStep(played.back());
        played.pop_back();
      }
      assert(a.sameState(Engine(h)));
    }
  }

  // Suicidal HUM moves leave the engine untouched
  {
    Engine engine(Handicap::HumSenteSikenbisha);
    int rejected = 0;
    for (int i = 0; i < 30; ++i) {
      Position pos = engine.position();
      MoveList moves;
      generateMoves(pos, moves);
      for (const Move& m : moves) {
        const UndoableMove u = pos.doMove(m);
        const bool suicide = pos.isChecked(HUM);
        pos.undoMove(u);
        if (!suicide) continue;

        const Engine before = engine;
        assert(!engine.tryStep(m).has_value());
        assert(engine.sameState(before));
        bool threw = false;
        try {
          (void)engine.doStep(m);
        } catch (const std::runtime_error&) {
          threw = true;
        }
        assert(threw);
        assert(engine.sameState(before));
        ++rejected;
      }

      const std::vector<Move> legal = humLegalMoves(engine);
      if (legal.empty()) break;
      const EngineResponse r = engine.doStep(legal[(static_cast<std::size_t>(i) * 5) % legal.size()]);
      if (!r.hasComMove() || r.comWins) break;
    }
    std::cout << "suicidal moves rejected: " << rejected << "\n";
  }

  // Trace hooks bracket every decision and leave the result unchanged
  {
    CountingTrace counter;
    Engine traced(Handicap::ComSenteSikenbisha, &counter);
    Engine plain(Handicap::ComSenteSikenbisha);
    assert(counter.thinks == 1);
    assert(traced.sameState(plain));

    for (int i = 0; i < 6; ++i) {
      const std::vector<Move> legal = humLegalMoves(plain);
      assert(!legal.empty());
      const Move m = legal[(static_cast<std::size_t>(i) * 3) % legal.size()];
      const EngineResponse rt = traced.doStep(m);
      const EngineResponse rp = plain.doStep(m);
      assert(rt.kind == rp.kind);
      assert(traced.sameState(plain));
      if (!rp.hasComMove() || rp.comWins) break;
    }
    assert(!counter.open);
    assert(counter.thinks == counter.ends);
    assert(counter.responses == counter.thinks);
    assert(counter.candidates > 0);
    assert(counter.candidates == counter.candidateEnds);

    std::ostringstream oss;
    TextTrace text(oss, false);
    Engine texted(Handicap::HumSenteNakabisha, &text);
    const std::vector<Move> legal = humLegalMoves(texted);
    (void)texted.doStep(legal.front());
    assert(!oss.str().empty());
  }

  // A set-up position starts with fresh replica state
  {
    const Position pos = decodeSfen("sfen 4k4/9/9/9/R8/9/9/9/8K b GSP 1").position();
    const Engine engine(Handicap::HumSenteSikenbisha, pos);
    assert(engine.position() == pos);
    assert(engine.progressPly() == 0);
    assert(!engine.firstComMove().has_value());
    assert(engine.book() == BookState(initialFormation(Handicap::HumSenteSikenbisha)));

    bool threw = false;
    try {
      const Engine wrongSide(Handicap::HumSenteSikenbisha, decodeSfen("sfen 4k4/9/9/9/9/9/9/9/4K4 w - 1").position());
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw);
  }

  // COM answering a check with drops in hand keeps the trace consistent
  {
    const Position pos = decodeSfen("sfen 4k4/9/9/9/8R/9/9/9/K8 b 2p2gs 1").position();
    CountingTrace counter;
    Engine traced(Handicap::HumSenteSikenbisha, pos, &counter);
    Engine plain(Handicap::HumSenteSikenbisha, pos);

    const Move check = Move::walk(sqAt(1, 5), sqAt(5, 5));
    const EngineResponse rt = traced.doStep(check);
    const EngineResponse rp = plain.doStep(check);
    assert(rt.kind == rp.kind);
    assert(traced.sameState(plain));
    assert(counter.thinks == 1 && counter.ends == 1);
    assert(counter.candidates > 0);
    if (rp.hasComMove()) assert(!plain.position().isChecked(COM));
    std::cout << "cheaper interposing drops: " << counter.cheaperDrops << "\n";
  }

  std::cout << "engine_test passed\n";
  return 0;
}
