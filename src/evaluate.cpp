// Position evaluation of the COM replica: advantage and disadvantage squares,
// root and leaf evaluations, the revision rules and the best-move comparison.

#include <algorithm>
#include <initializer_list>
#include <optional>
#include <string_view>

#include "naitou/engine.hpp"
#include "naitou/movegen.hpp"
#include "naitou/pricing.hpp"
#include "naitou/tables.hpp"
#include "naitou/trace.hpp"

namespace naitou {

namespace {

constexpr auto NAITOU_SQUARES = naitouSquares();

// Byte arithmetic as in Naitou.
inline void wrapAdd(std::uint8_t& x, int v) {
  x = static_cast<std::uint8_t>(x + v);
}

inline void wrapSub(std::uint8_t& x, int v) {
  x = static_cast<std::uint8_t>(x - v);
}

Bitboard81 promotedPieces(const Position& pos) {
  Bitboard81 bb;
  for (int k = PRO_PAWN; k <= DRAGON; ++k) bb |= pos.kindBB(static_cast<PieceKind>(k));
  return bb;
}

// Decides a comparison when a and b differ: a > b means the candidate wins.
std::optional<bool> tieBreak(int a, int b) {
  if (a > b) return true;
  if (a < b) return false;
  return std::nullopt;
}

} // namespace

LeafEvaluation LeafEvaluation::worst() {
  LeafEvaluation e;
  e.disadvPrice = 99;
  e.scoreNega = 99;
  e.comKingThreat25 = 99;
  e.comKingThreat8 = 99;
  e.comKingChoke8 = 99;
  e.dstToHumKing = 99;
  e.humHanging = true;
  e.comLooseCount = 99;
  return e;
}

// An advantage square holds a HUM piece COM can win: attacked by COM and
// either undefended or defended but attacked by a cheaper COM piece. Equal
// prices count once the opening is over.
template <class F>
void Engine::forEachAdvantageSquare(F&& f) const {
  for (const std::uint8_t s : NAITOU_SQUARES) {
    const Piece pc = pos_.at(s);
    if (pc == NO_PIECE || pieceSide(pc) != HUM) continue;
    if (pos_.effectCount(COM, s) == 0) continue;

    const PieceKind pk = pieceKind(pc);
    if (pos_.effectCount(HUM, s) == 0) {
      f(s, pk);
      continue;
    }

    const PieceKind atk = naitouAttacker(pos_, COM, s);
    const std::uint8_t pricePc = PRICE_B[pk];
    const std::uint8_t priceAtk = PRICE_B[atk];
    if (priceAtk < pricePc || (priceAtk == pricePc && progressLevel_ != 0)) f(s, pk);
  }
}

// A disadvantage square holds a COM piece HUM can win. Once COM could
// recapture on one of them, the exchange flag stays set for every later
// square in scan order.
template <class F>
void Engine::forEachDisadvantageSquare(F&& f) const {
  bool exchange = false;
  for (const std::uint8_t s : NAITOU_SQUARES) {
    const Piece pc = pos_.at(s);
    if (pc == NO_PIECE || pieceSide(pc) != COM) continue;

    const std::uint8_t effHum = pos_.effectCount(HUM, s);
    if (effHum == 0) continue;

    const PieceKind pk = pieceKind(pc);
    const std::uint8_t effCom = pos_.effectCount(COM, s);
    if (pk == KING || effCom == 0) {
      f(s, pk, exchange);
      continue;
    }

    const int pricePc = PRICE_D[pk];
    const int priceAtkHum = PRICE_C[naitouAttacker(pos_, HUM, s)];
    const int priceAtkCom = PRICE_D[naitouAttacker(pos_, COM, s)];
    if (effCom < effHum) {
      if (pricePc + priceAtkCom >= priceAtkHum) f(s, pk, exchange);
    } else if (pricePc > priceAtkHum) {
      exchange = true;
      f(s, pk, exchange);
    }
  }
}

std::uint8_t Engine::disadvantagePrice() const {
  std::uint8_t price = 0;
  forEachDisadvantageSquare([&](std::uint8_t, PieceKind pk, bool exchange) {
    price = std::max(price, PRICE_D[pk]);
    if (exchange) wrapSub(price, 1);
  });
  return price;
}

RootEvaluation Engine::evaluateRoot() const {
  RootEvaluation e;

  forEachAdvantageSquare([&](std::uint8_t, PieceKind pk) { e.advPrice = std::max(e.advPrice, PRICE_B[pk]); });
  e.disadvPrice = disadvantagePrice();

  const Bitboard81 promo = promotedPieces(pos_);
  const std::uint32_t humPromo = (promo & pos_.occupiedBy(HUM)).popcount();
  const std::uint32_t comPromo = (promo & pos_.occupiedBy(COM)).popcount();

  // Doubled from progress ply 77 on.
  std::uint32_t plyFactor = progressPly_ / 11u;
  if (plyFactor >= 7) plyFactor *= 2;

  const Hand& hh = pos_.hands()[HUM];
  const Hand& hc = pos_.hands()[COM];

  e.powerHum = static_cast<std::uint8_t>(8u * (humPromo + hh[ROOK] + hh[BISHOP]) + 4u * (hh[GOLD] + hh[SILVER]) +
                                         2u * (hh[KNIGHT] + hh[LANCE]) + hh[PAWN] + plyFactor);
  e.rbpCom = static_cast<std::uint8_t>(comPromo + hc[ROOK] + hc[BISHOP]);
  e.powerCom = static_cast<std::uint8_t>(8u * e.rbpCom + 4u * (hc[GOLD] + hc[SILVER]) + 2u * (hc[KNIGHT] + hc[LANCE]) +
                                         hc[PAWN] + plyFactor);
  e.kingSq = {pos_.kingSq(HUM), pos_.kingSq(COM)};
  return e;
}

std::optional<LeafEvaluation> Engine::evaluateLeaf(const RootEvaluation& root, const UndoableMove& um) {
  const std::uint8_t humKing = root.kingSq[HUM];
  const std::uint8_t comKing = root.kingSq[COM];
  const Move& m = um.move;

  LeafEvaluation leaf;
  bool sacrifice = false;

  leaf.capturePrice = um.isCapture() ? PRICE_A[pieceKind(um.pieceCaptured)] : 0;

  forEachAdvantageSquare([&](std::uint8_t s, PieceKind pk) {
    const std::uint8_t price = PRICE_B[pk];
    wrapAdd(leaf.scorePosi, price);
    if (price > leaf.advPrice) {
      leaf.advPrice = price;
      leaf.advSq = s;
    }
  });

  forEachDisadvantageSquare([&](std::uint8_t s, PieceKind pk, bool exchange) {
    if (m.dst == s && leaf.capturePrice == 0) sacrifice = true;

    const std::uint8_t price = PRICE_D[pk];
    wrapAdd(leaf.scoreNega, price);
    if (price > leaf.disadvPrice) {
      leaf.disadvPrice = price;
      leaf.disadvSq = s;
    }
    if (exchange) {
      wrapSub(leaf.scoreNega, 1);
      wrapSub(leaf.disadvPrice, 1);
    }
  });

  // Mate is only tested for checks given near the HUM king while COM's own
  // king is safe.
  leaf.humCheckmated = leaf.disadvPrice < 30 && leaf.advPrice >= 30 && distance(m.dst, humKing) < 3 &&
                       isCheckmatedNaitou(pos_);
  if (leaf.humCheckmated) {
    if (m.drop && m.dropKind() == PAWN) {
      if (trace_) trace_->candidateRejected("drop-pawn-mate");
      return std::nullopt;
    }
    leaf.advPrice = 60;
    leaf.capturePrice = 60;
    leaf.disadvPrice = 0;
  }

  if (sacrifice && root.disadvPrice < 30 && !leaf.humCheckmated) {
    if (trace_) trace_->candidateRejected("sacrifice");
    return std::nullopt;
  }

  const Tables& t = tables();

  Bitboard81 bb = t.around25[humKing];
  while (bb.any()) wrapAdd(leaf.humKingThreat25, pos_.effectCount(COM, bb.pop_lsb()));

  bb = t.around25[comKing];
  while (bb.any()) {
    const std::uint8_t s = bb.pop_lsb();
    wrapAdd(leaf.comKingSafety25, pos_.effectCount(COM, s));
    wrapAdd(leaf.comKingThreat25, pos_.effectCount(HUM, s));
  }

  bb = t.kingEffect[comKing];
  while (bb.any()) {
    const std::uint8_t s = bb.pop_lsb();
    const std::uint8_t effHum = pos_.effectCount(HUM, s);
    wrapAdd(leaf.comKingThreat8, effHum);
    if (effHum >= pos_.effectCount(COM, s)) ++leaf.comKingChoke8;
  }

  leaf.srcToComKing = static_cast<std::uint8_t>(distance(m.drop ? m.dst : m.src, comKing));
  leaf.dstToHumKing = static_cast<std::uint8_t>(distance(m.dst, humKing));

  // A HUM pawn or lance on ranks 2..4 whose square ahead HUM controls better.
  bb = (pos_.pieces(HUM, PAWN) | pos_.pieces(HUM, LANCE)) & farRows(HUM, 4);
  while (bb.any()) {
    const std::uint8_t s = bb.pop_lsb();
    if (row(s) == 0) continue;
    const std::uint8_t ahead = static_cast<std::uint8_t>(s - 1);
    if (pos_.effectCount(HUM, ahead) > pos_.effectCount(COM, ahead)) {
      leaf.humHanging = true;
      break;
    }
  }

  const Bitboard81 minor = pos_.kindBB(PAWN) | pos_.kindBB(LANCE) | pos_.kindBB(KNIGHT) | pos_.kindBB(KING);
  bb = pos_.occupiedBy(COM).andNot(minor);
  while (bb.any()) {
    if (pos_.effectCount(COM, bb.pop_lsb()) == 0) ++leaf.comLooseCount;
  }

  leaf.comPromoCount = static_cast<std::uint8_t>((promotedPieces(pos_) & pos_.occupiedBy(COM)).popcount());
  leaf.suicide = pos_.isChecked(COM);
  return leaf;
}

void Engine::revise(const RootEvaluation& root, const UndoableMove& um, LeafEvaluation& leaf) const {
  const std::uint8_t humKing = root.kingSq[HUM];
  const std::uint8_t comKing = root.kingSq[COM];
  const Move& m = um.move;
  const int dstToComKing = distance(m.dst, comKing);
  const PieceKind pkDst = m.drop ? m.dropKind() : pieceKind(um.pieceDst());
  const bool bigDrop = m.drop && (pkDst == BISHOP || pkDst == ROOK);

  auto rule = [&](std::string_view name) {
    if (trace_) trace_->revision(name, leaf);
  };

  if (leaf.disadvPrice < 20 && leaf.capturePrice > 0 && pkDst == PAWN) {
    rule("capture-by-pawn");
    wrapSub(leaf.scoreNega, 1);
  }

  if (trace_) trace_->leafEvaluation("ini", leaf);

  if (leaf.humHanging) {
    rule("hum-hanging");
    wrapAdd(leaf.scoreNega, 4);
  }

  // Midgame: a pawn lost far from COM's king does not matter.
  if ((root.powerHum >= 15 || root.powerCom >= 15) && leaf.scoreNega < 3 && leaf.disadvSq != SQ_NONE &&
      distance(comKing, leaf.disadvSq) >= 4) {
    rule("midgame-attacked-pawn");
    wrapSub(leaf.scoreNega, leaf.disadvPrice);
  }

  if (root.powerHum >= 25 || root.powerCom >= 25) {
    if (leaf.advSq != SQ_NONE && distance(humKing, leaf.advSq) >= 4 && distance(comKing, leaf.advSq) >= 3) {
      rule("endgame-unimportant-adv-sq");
      wrapSub(leaf.scorePosi, leaf.advPrice);
    }

    if (leaf.disadvSq != SQ_NONE && leaf.disadvPrice < 7 && distance(humKing, leaf.disadvSq) >= 3 &&
        distance(comKing, leaf.disadvSq) >= 3) {
      rule("endgame-unimportant-cheap-disadv-sq");
      wrapSub(leaf.scoreNega, leaf.disadvPrice);
    }

    if (leaf.capturePrice > 0) {
      if (leaf.dstToHumKing <= 2) {
        rule("endgame-capture-near-hum-king");
        wrapAdd(leaf.capturePrice, 2);
      } else if (leaf.dstToHumKing >= 4 && dstToComKing >= 4) {
        rule("endgame-unimportant-capture");
        wrapSub(leaf.capturePrice, 3);
      }
    }
  }

  // A check without follow-up, unless it also attacks something else.
  if (leaf.advPrice >= 30 && leaf.humKingThreat25 < 12 && root.rbpCom < 4 && root.powerCom < 35 &&
      static_cast<std::uint8_t>(leaf.scorePosi - leaf.advPrice) < 3) {
    rule("useless-check");
    wrapSub(leaf.scorePosi, leaf.advPrice);
  }

  // Silver, bishop, rook or gold dropped on COM's side away from both kings.
  if (m.drop && pkDst >= SILVER && pkDst <= GOLD && row(m.dst) <= 4 && root.disadvPrice < 30 &&
      leaf.dstToHumKing >= 3 && dstToComKing >= 3) {
    rule("useless-drop");
    wrapAdd(leaf.scoreNega, 2);
  }

  if (root.powerCom >= 27) {
    if (leaf.scorePosi >= 6) {
      rule("increase-capture-price");
      wrapAdd(leaf.capturePrice, 4);
    } else if (leaf.scorePosi >= 3) {
      rule("increase-capture-price");
      wrapAdd(leaf.capturePrice, 1);
    }
  }

  if (bigDrop) {
    const int r = row(m.dst);
    if (r >= 7) {
      rule("good-rook-bishop-drop");
      wrapAdd(leaf.scorePosi, 2);
      wrapSub(leaf.scoreNega, 2);
    } else if (root.disadvPrice < 30) {
      rule("bad-rook-bishop-drop");
      wrapSub(leaf.scorePosi, 2);
      wrapAdd(leaf.scoreNega, 2);
      if (r <= 3) wrapAdd(leaf.scoreNega, 2);
    }
  }

  // Applies to every king move, captures or not.
  if (pkDst == KING) {
    rule("capture-by-king");
    wrapSub(leaf.capturePrice, 1);
    wrapSub(leaf.scorePosi, 2);
  }

  if (root.powerCom >= 31 && leaf.advPrice < 4 && leaf.disadvPrice == 0 && leaf.humKingThreat25 >= 7 &&
      naitouDistance(leaf.advSq, comKing) <= 2) {
    rule("cheap-adv-sq-near-king");
    wrapAdd(leaf.scorePosi, (leaf.humKingThreat25 - 7) / 2);
  }

  // COM does not offer a bishop exchange itself.
  if (leaf.advPrice == 16 && pkDst == BISHOP) {
    rule("inhibit-bishop-exchange");
    wrapSub(leaf.scorePosi, leaf.advPrice);
    leaf.advPrice = 0;
  }

  if (root.powerCom >= 27 && !bigDrop) {
    rule("keep-rook-bishop-in-emergency");
    const int penalty = 4 * leaf.comKingChoke8;
    wrapSub(leaf.scorePosi, penalty);
    wrapAdd(leaf.scoreNega, penalty);
  }

  const Piece captured = um.pieceCaptured;
  if (leaf.capturePrice >= 8 && captured >= makePiece(HUM, SILVER) && captured <= makePiece(HUM, KING) &&
      (leaf.advPrice >= 30 || naitouDistance(leaf.advSq, humKing) < 3) && root.powerCom >= 30 &&
      leaf.humKingThreat25 >= 7 && root.rbpCom >= 4) {
    rule("capture-near-hum-king");
    wrapAdd(leaf.scorePosi, 2);
    if (leaf.disadvPrice >= 8 && leaf.disadvPrice < 30) {
      leaf.scoreNega = 8;
      leaf.disadvPrice = 8;
    }
  }

  if (leaf.comKingThreat8 >= 5 && pkDst == KING) {
    rule("capture-by-king-in-emergency");
    leaf.capturePrice = 0;
  }

  if (root.powerCom >= 35 && leaf.advPrice >= 30 && leaf.capturePrice >= 2) {
    rule("capturing-check");
    wrapSub(leaf.scoreNega, 2);
  }

  if (root.powerCom >= 20 && leaf.capturePrice < 2) {
    if (leaf.scorePosi >= 5) rule("cheap-capture-price");
    if (leaf.scorePosi >= 20) wrapAdd(leaf.capturePrice, 3);
    else if (leaf.scorePosi >= 10) wrapAdd(leaf.capturePrice, 2);
    else if (leaf.scorePosi >= 5) wrapAdd(leaf.capturePrice, 1);
  }

  if (bigDrop && row(m.dst) <= 5) {
    rule("bad-rook-bishop-drop-2");
    wrapSub(leaf.scorePosi, 3);
    wrapAdd(leaf.scoreNega, 3);
  }

  // Promoted pieces should head for the HUM king.
  if (!m.drop && isPromoted(pieceKind(um.pieceSrc))) {
    rule("promoted-walk");
    wrapAdd(leaf.scorePosi, distance(m.src, humKing) - distance(m.dst, humKing));
  }

  if (root.powerCom >= 25 && leaf.advPrice >= 30) {
    rule("check-with-power");
    wrapAdd(leaf.scorePosi, 4);
    wrapAdd(leaf.capturePrice, 1);
    wrapSub(leaf.scoreNega, 2);
  }

  if (leaf.advPrice >= 30 && leaf.capturePrice >= 8) {
    rule("good-capturing-check");
    wrapSub(leaf.scoreNega, 4);
  }

  // Negative bytes become 0.
  for (std::uint8_t* x : {&leaf.capturePrice, &leaf.scorePosi, &leaf.scoreNega}) {
    if (*x & 0x80) *x = 0;
  }
}

bool Engine::canImproveBest(const RootEvaluation& root, const LeafEvaluation& best, const LeafEvaluation& leaf,
                            const UndoableMove& um) const {
  auto decide = [&](std::string_view rule, bool improved) {
    if (trace_) trace_->comparison(rule, improved);
    return improved;
  };

  // A move that loses the COM king never beats one that does not.
  if (leaf.disadvPrice >= 40 && best.disadvPrice < 40) return decide("suicide", false);
  if (leaf.disadvPrice < 40 && best.disadvPrice >= 40) return decide("suicide", true);

  if (leaf.scoreNega > best.scoreNega) {
    if (leaf.capturePrice < best.capturePrice) return decide("nega-worse-capture-worse", false);
    if (leaf.capturePrice > best.capturePrice) {
      const int dcapture = leaf.capturePrice - best.capturePrice;
      const int dnega = leaf.scoreNega - best.scoreNega;
      return decide("nega-worse-capture-better", dcapture >= dnega);
    }
    bool improved = false;
    if (root.powerCom >= 18 && leaf.capturePrice == 0 && leaf.scorePosi > best.scorePosi) {
      improved = leaf.scorePosi - best.scorePosi > leaf.scoreNega - best.scoreNega;
    }
    return decide("nega-worse-capture-equal", improved);
  }

  if (leaf.scoreNega < best.scoreNega) {
    if (best.scoreNega >= 30 && best.scoreNega < 80) return decide("nega-better-extreme", true);
    if (leaf.capturePrice > best.capturePrice) return decide("nega-better-capture-better", true);

    const int dnega = best.scoreNega - leaf.scoreNega;
    if (leaf.capturePrice < best.capturePrice) {
      if (auto r = tieBreak(dnega, best.capturePrice - leaf.capturePrice)) {
        return decide("nega-better-capture-worse", *r);
      }
    } else if (root.powerCom >= 18 && leaf.capturePrice == 0 && leaf.scorePosi < best.scorePosi) {
      if (auto r = tieBreak(dnega, best.scorePosi - leaf.scorePosi)) return decide("nega-better-capture-equal", *r);
    } else {
      return decide("nega-better-capture-equal", true);
    }
  } else if (auto r = tieBreak(leaf.capturePrice, best.capturePrice)) {
    return decide("nega-equal", *r);
  }

  if (auto r = tieBreak(leaf.comPromoCount, best.comPromoCount)) return decide("com-promo-count", *r);
  if (auto r = tieBreak(leaf.scorePosi, best.scorePosi)) return decide("score-posi", *r);
  if (auto r = tieBreak(leaf.advPrice, best.advPrice)) return decide("adv-price", *r);

  const Move& m = um.move;
  if (m.drop) {
    // Walks beat drops unless COM has to interpose.
    if (root.disadvPrice < 30) return decide("prefer-walk", false);
    // Only an improvement is traced.
    if (comDropSrcValue(m.dropKind()) >= bestSrcValue_) return false;
    return decide("drop-prefer-cheap", true);
  }

  if (auto r = tieBreak(leaf.humKingThreat25, best.humKingThreat25)) return decide("hum-king-threat-25", *r);
  if (auto r = tieBreak(leaf.comKingSafety25, best.comKingSafety25)) return decide("com-king-safety-25", *r);
  if (auto r = tieBreak(best.comKingThreat25, leaf.comKingThreat25)) return decide("com-king-threat-25", *r);
  if (auto r = tieBreak(best.comLooseCount, leaf.comLooseCount)) return decide("com-loose-count", *r);
  if (leaf.srcToComKing >= 3) {
    if (auto r = tieBreak(best.dstToHumKing, leaf.dstToHumKing)) return decide("dst-to-hum-king", *r);
  }
  return decide("src-to-com-king", leaf.srcToComKing > best.srcToComKing);
}

} // namespace naitou
