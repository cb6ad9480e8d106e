#include "naitou/trace.hpp"

#include <string>

#include "naitou/engine.hpp"
#include "naitou/sfen.hpp"

namespace naitou {

namespace {

std::string squareOrNone(std::uint8_t s) {
  return (s == SQ_NONE) ? std::string("-") : squareToString(s);
}

} // namespace

void TextTrace::thinkStart(const Position& pos) {
  os_ << "think " << pos.ply() << "\n";
  os_ << "position " << encodeSfenPosition(pos.sideToMove(), pos.board(), pos.hands()) << "\n";
  os_ << "effect HUM\n" << pos.prettyEffects(HUM);
  os_ << "effect COM\n" << pos.prettyEffects(COM);
}

void TextTrace::progress(int ply, int level, int levelSub) {
  os_ << "progress " << ply << " " << level << " " << levelSub << "\n";
}

void TextTrace::formation(Formation f) {
  os_ << "formation " << formationName(f) << "\n";
}

void TextTrace::rootEvaluation(const RootEvaluation& e) {
  os_ << "root adv=" << int(e.advPrice) << " disadv=" << int(e.disadvPrice) << " power_hum=" << int(e.powerHum)
      << " power_com=" << int(e.powerCom) << " rbp_com=" << int(e.rbpCom) << " king_hum=" << squareOrNone(e.kingSq[HUM])
      << " king_com=" << squareOrNone(e.kingSq[COM]) << "\n";
}

void TextTrace::candidateStart(const Position& after, const Move& m) {
  os_ << "cand " << moveToString(m) << "\n";
  if (!verbose_) return;
  os_ << after.pretty();
  os_ << "effect HUM\n" << after.prettyEffects(HUM);
  os_ << "effect COM\n" << after.prettyEffects(COM);
}

void TextTrace::candidateRejected(std::string_view reason) {
  os_ << "reject " << reason << "\n";
}

void TextTrace::leafEvaluation(std::string_view stage, const LeafEvaluation& e) {
  os_ << "leaf " << stage << " capture=" << int(e.capturePrice) << " adv=" << int(e.advPrice) << "@"
      << squareOrNone(e.advSq) << " disadv=" << int(e.disadvPrice) << "@" << squareOrNone(e.disadvSq)
      << " posi=" << int(e.scorePosi) << " nega=" << int(e.scoreNega) << " hum_threat25=" << int(e.humKingThreat25)
      << " com_safety25=" << int(e.comKingSafety25) << " com_threat25=" << int(e.comKingThreat25)
      << " com_threat8=" << int(e.comKingThreat8) << " com_choke8=" << int(e.comKingChoke8)
      << " src_com_king=" << int(e.srcToComKing) << " dst_hum_king=" << int(e.dstToHumKing)
      << " hanging=" << e.humHanging << " promo=" << int(e.comPromoCount) << " loose=" << int(e.comLooseCount)
      << " mate=" << e.humCheckmated << " suicide=" << e.suicide << "\n";
}

void TextTrace::revision(std::string_view rule, const LeafEvaluation&) {
  os_ << "revise " << rule << "\n";
}

void TextTrace::comparison(std::string_view rule, bool improved) {
  os_ << "cmp " << rule << " " << (improved ? "better" : "worse") << "\n";
}

void TextTrace::best(std::optional<Move> m, const LeafEvaluation& e) {
  os_ << "best " << (m ? moveToString(*m) : std::string("-")) << " capture=" << int(e.capturePrice)
      << " posi=" << int(e.scorePosi) << " nega=" << int(e.scoreNega) << "\n";
}

void TextTrace::candidateEnd() {
  os_ << "cand-end\n";
}

void TextTrace::bookStart() {
  os_ << "book\n";
}

void TextTrace::bookAccept(const Move& m) {
  os_ << "book-accept " << moveToString(m) << "\n";
}

void TextTrace::response(std::string_view kind, std::optional<Move> m) {
  os_ << "response " << kind;
  if (m) os_ << " " << moveToString(*m);
  os_ << "\n";
}

void TextTrace::thinkEnd() {
  os_ << "think-end\n";
  os_.flush();
}

} // namespace naitou
