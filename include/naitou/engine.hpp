#pragma once

#include <array>
#include <cstdint>
#include <optional>

#include "naitou/book.hpp"
#include "naitou/handicap.hpp"
#include "naitou/move.hpp"
#include "naitou/position.hpp"

namespace naitou {

class TraceSink;

// Evaluation of the position COM thinks in. All fields are bytes and wrap
// the way Naitou's arithmetic does.
struct RootEvaluation {
  std::uint8_t advPrice = 0;    // largest HUM piece on an advantage square
  std::uint8_t disadvPrice = 0; // largest COM piece on a disadvantage square
  std::uint8_t powerHum = 0;
  std::uint8_t powerCom = 0;
  std::uint8_t rbpCom = 0; // COM rooks and bishops in hand plus promoted pieces
  std::array<std::uint8_t, 2> kingSq{};
};

// Evaluation of the position after one COM candidate move. King distances
// use the king squares of the root position.
struct LeafEvaluation {
  std::uint8_t capturePrice = 0;
  std::uint8_t advPrice = 0;
  std::uint8_t advSq = SQ_NONE;
  std::uint8_t disadvPrice = 0;
  std::uint8_t disadvSq = SQ_NONE;
  std::uint8_t scorePosi = 0;
  std::uint8_t scoreNega = 0;
  std::uint8_t humKingThreat25 = 0;
  std::uint8_t comKingSafety25 = 0;
  std::uint8_t comKingThreat25 = 0;
  std::uint8_t comKingThreat8 = 0;
  std::uint8_t comKingChoke8 = 0;
  std::uint8_t srcToComKing = 0;
  std::uint8_t dstToHumKing = 0;
  bool humHanging = false;
  std::uint8_t comPromoCount = 0;
  std::uint8_t comLooseCount = 0;
  bool humCheckmated = false;
  bool suicide = false;

  // Starting point of the best-move scan; every accepted candidate beats it.
  [[nodiscard]] static LeafEvaluation worst();
};

// Replica state restored by Engine::undoStep.
struct EngineUndo {
  UndoableMove humMove;
  std::uint8_t progressPly = 0;
  std::uint8_t progressLevel = 0;
  std::uint8_t progressLevelSub = 0;
  BookState book{Formation::Nothing};
  std::uint8_t bestSrcValue = 0;
};

// COM's answer to a HUM move.
//   Move:       COM replied with comMove; comWins is set when it mates HUM.
//   HumWin:     COM resigned.
//   HumSuicide: HUM's move let COM take the HUM king.
struct EngineResponse {
  enum class Kind : std::uint8_t { Move, HumWin, HumSuicide };

  Kind kind = Kind::Move;
  UndoableMove comMove{};
  bool comWins = false;
  EngineUndo undo{};

  [[nodiscard]] bool hasComMove() const { return kind == Kind::Move; }
};

// Deterministic replica of Naitou's COM player. The engine
// holds the game position (HUM to move between steps) and all state the
// game carries from move to move.
class Engine {
public:
  // Starts a game. When COM moves first its opening move is played here and
  // reported by firstComMove().
  explicit Engine(Handicap handicap, TraceSink* trace = nullptr);

  // Continues a game of the given setup from an arbitrary position with HUM
  // to move. The replica state is that of a fresh game.
  Engine(Handicap handicap, const Position& pos, TraceSink* trace = nullptr);

  [[nodiscard]] Handicap handicap() const { return handicap_; }
  [[nodiscard]] const Position& position() const { return pos_; }
  [[nodiscard]] int progressPly() const { return progressPly_; }
  [[nodiscard]] int progressLevel() const { return progressLevel_; }
  [[nodiscard]] int progressLevelSub() const { return progressLevelSub_; }
  [[nodiscard]] const BookState& book() const { return book_; }
  [[nodiscard]] std::optional<UndoableMove> firstComMove() const { return firstComMove_; }

  void setTrace(TraceSink* trace) { trace_ = trace; }

  // Plays a pseudo-legal HUM move and COM's answer. HUM pawn-drop mates are
  // allowed. Returns nullopt, leaving the engine untouched, when the HUM move
  // leaves its own king in check.
  [[nodiscard]] std::optional<EngineResponse> tryStep(const Move& humMove);

  // As tryStep, but a suicidal HUM move throws std::runtime_error.
  EngineResponse doStep(const Move& humMove);

  void undoStep(const EngineResponse& resp);

  // Replica state compared as a whole; the trace sink is not part of it.
  [[nodiscard]] bool sameState(const Engine& o) const;

private:
  struct Decision {
    enum class Kind : std::uint8_t { Move, HumWin, HumSuicide };
    Kind kind = Kind::Move;
    Move best{};
    bool quiet = false;
    bool skipBook = false;
    bool humCheckmated = false;
  };

  Handicap handicap_;
  Position pos_;
  std::uint8_t progressPly_ = 0;      // 0..100, 0 at the start position
  std::uint8_t progressLevel_ = 0;    // 0..3
  std::uint8_t progressLevelSub_ = 0; // 0..5, only used at level 0
  BookState book_;
  // Source value of the current best drop. Naitou never resets it
  // between positions, so it is part of the carried state.
  std::uint8_t bestSrcValue_ = 0;
  std::optional<UndoableMove> firstComMove_;
  TraceSink* trace_ = nullptr;

  Decision think(std::optional<Move> humMove);
  Decision thinkSearch(const RootEvaluation& root);
  std::optional<Move> thinkBook(std::optional<Move> humMove);
  [[nodiscard]] bool bookMoveIsLegal(const Move& m) const;
  std::uint8_t bookMoveDisadvPrice(const Move& m);

  [[nodiscard]] RootEvaluation evaluateRoot() const;
  std::optional<LeafEvaluation> evaluateLeaf(const RootEvaluation& root, const UndoableMove& um);
  void revise(const RootEvaluation& root, const UndoableMove& um, LeafEvaluation& leaf) const;
  [[nodiscard]] bool canImproveBest(const RootEvaluation& root, const LeafEvaluation& best,
                                    const LeafEvaluation& leaf, const UndoableMove& um) const;

  template <class F>
  void forEachAdvantageSquare(F&& f) const;
  template <class F>
  void forEachDisadvantageSquare(F&& f) const;
  [[nodiscard]] std::uint8_t disadvantagePrice() const;

  UndoableMove playCom(const Move& m);
  void bumpProgressPly();
};

} // namespace naitou
