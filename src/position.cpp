#include "naitou/position.hpp"

#include <bit>
#include <sstream>

#include "naitou/tables.hpp"

namespace naitou {

Board evenBoard() {
  Board b{};
  constexpr PieceKind back[N] = {LANCE, KNIGHT, SILVER, GOLD, KING, GOLD, SILVER, KNIGHT, LANCE};
  for (int c = 0; c < N; ++c) {
    b[sq(c, 0)] = makePiece(COM, back[c]);
    b[sq(c, 2)] = makePiece(COM, PAWN);
    b[sq(c, 6)] = makePiece(HUM, PAWN);
    b[sq(c, 8)] = makePiece(HUM, back[c]);
  }
  b[sqAt(2, 2)] = makePiece(COM, BISHOP);
  b[sqAt(8, 2)] = makePiece(COM, ROOK);
  b[sqAt(8, 8)] = makePiece(HUM, BISHOP);
  b[sqAt(2, 8)] = makePiece(HUM, ROOK);
  return b;
}

Position::Position(Side toMove, const Board& board, const Hands& hands)
  : board_(board), hands_(hands), side_(toMove), ply_(1) {
  for (std::uint8_t s = 0; s < SQ_N; ++s) {
    const Piece pc = board_[s];
    if (pc == NO_PIECE) continue;
    xorPiece(s, pc);
    if (pieceKind(pc) == KING) kingSq_[pieceSide(pc)] = s;
  }

  comNonkingCount_ = occSide_[COM].popcount() - 1;
  for (int k = PAWN; k <= GOLD; ++k) comNonkingCount_ += hands_[COM][k];

  rebuildEffects();
}

Position Position::even() {
  return Position(HUM, evenBoard(), Hands{});
}

void Position::putPiece(std::uint8_t s, Piece pc) {
  assert(board_[s] == NO_PIECE);
  board_[s] = pc;
  xorPiece(s, pc);
}

void Position::removePiece(std::uint8_t s) {
  const Piece pc = board_[s];
  assert(pc != NO_PIECE);
  board_[s] = NO_PIECE;
  xorPiece(s, pc);
}

void Position::xorPiece(std::uint8_t s, Piece pc) {
  occ_.toggle(s);
  occSide_[pieceSide(pc)].toggle(s);
  kindBB_[pieceKind(pc)].toggle(s);
}

void Position::rebuildEffects() {
  const Tables& t = tables();
  counts_ = {};
  ranged_ = {};

  Bitboard81 occ = occ_;
  while (occ.any()) {
    const std::uint8_t src = occ.pop_lsb();
    const Piece pc = board_[src];
    const Side side = pieceSide(pc);

    addMelee(pc, src, side, 1);

    const DirSet dirs = dspGet(rangedDirs(pc), side);
    for (int d = 0; d < 8; ++d) {
      if (!(dirs & dirBit(d))) continue;
      for (std::uint8_t x = t.next[src][d]; x != SQ_NONE; x = t.next[x][d]) {
        bump(side, x, 1);
        ranged_[x] ^= dspPart(side, dirBit(d));
        const Piece blocker = board_[x];
        if (blocker == NO_PIECE) continue;
        if (pieceSide(blocker) == side && (supportedDirs(blocker) & dirBit(d)) && t.next[x][d] != SQ_NONE) {
          bump(side, t.next[x][d], 1);
        }
        break;
      }
    }
  }
}

void Position::addMelee(Piece pc, std::uint8_t s, Side side, int delta) {
  Bitboard81 bb = meleeEffect(pc, s);
  while (bb.any()) bump(side, bb.pop_lsb(), delta);
}

// Moves pcSrc's step effect from src to pcDst's at dst for the side to move.
// Squares in both sets keep their count.
void Position::swapMelee(Piece pcSrc, std::uint8_t src, Piece pcDst, std::uint8_t dst, int delta) {
  Bitboard81 dec = meleeEffect(pcSrc, src);
  Bitboard81 inc = meleeEffect(pcDst, dst);
  const Bitboard81 common = dec & inc;
  dec ^= common;
  inc ^= common;
  while (dec.any()) bump(side_, dec.pop_lsb(), -delta);
  while (inc.any()) bump(side_, inc.pop_lsb(), delta);
}

void Position::addShadow(Piece pc, std::uint8_t s, Side side, int delta) {
  const Tables& t = tables();
  const DirSet dirs = supportedDirs(pc) & dspGet(ranged_[s], side);
  for (int d = 0; d < 8; ++d) {
    if ((dirs & dirBit(d)) && t.next[s][d] != SQ_NONE) bump(side, t.next[s][d], delta);
  }
}

// Placing (put) or lifting a piece of the side to move on s changes the rays
// in dspUs (the piece's own) and dspOthers (rays already crossing s, both
// sides). Walks every affected direction once and fixes counts, ray marks
// and the shadow square behind the first blocker.
void Position::updateRanged(std::uint8_t s, DirSetPair dspUs, DirSetPair dspOthers, bool put) {
  const Tables& t = tables();
  const Side us = side_;
  const Side them = other(us);
  const int sign = put ? 1 : -1;

  auto dsp = static_cast<DirSetPair>(dspUs ^ dspOthers);
  while (dsp != 0) {
    const int dir = std::countr_zero(dsp) & 7;
    const auto dspDir = static_cast<DirSetPair>(dsp & dspBoth(dirBit(dir)));
    dsp = static_cast<DirSetPair>(dsp & ~dspDir);

    int eUs = 0;
    if (dspGet(dspDir, us) != 0) eUs = ((dspUs & dspDir) == 0) ? -sign : sign;
    const int eThem = (dspGet(dspDir, them) != 0) ? -sign : 0;

    for (std::uint8_t x = t.next[s][dir]; x != SQ_NONE; x = t.next[x][dir]) {
      bump(us, x, eUs);
      bump(them, x, eThem);
      ranged_[x] ^= dspDir;

      const Piece pc = board_[x];
      if (pc == NO_PIECE) continue;

      const std::uint8_t x2 = t.next[x][dir];
      if (x2 != SQ_NONE) {
        const DirSet sup = supportedDirs(pc);
        if (pieceSide(pc) == us && (sup & dspGet(dspDir, us))) bump(us, x2, eUs);
        else if (pieceSide(pc) == them && (sup & dspGet(dspDir, them))) bump(them, x2, eThem);
      }
      break;
    }
  }
}

// Same as updateRanged, with hideSq temporarily holding a piece that has no
// shadow effect so a half-moved piece does not leave a false one.
void Position::updateRangedMasked(std::uint8_t s, std::uint8_t hideSq, DirSetPair dspUs, DirSetPair dspOthers,
                                  bool put) {
  const Piece saved = board_[hideSq];
  board_[hideSq] = H_KNIGHT;
  updateRanged(s, dspUs, dspOthers, put);
  board_[hideSq] = saved;
}

// Rays running back along the move line are unchanged at src.
static DirSetPair moveMask(std::uint8_t src, std::uint8_t dst) {
  const DirSet mv = dirBetween(src, dst);
  if (mv == 0) return DSP_ALL; // knight
  const auto d = static_cast<Direction>(std::countr_zero(mv));
  return static_cast<DirSetPair>(~dspBoth(dirBit(invDir(d))));
}

void Position::effectByNoncapture(std::uint8_t src, std::uint8_t dst, Piece pcSrc, Piece pcDst) {
  const Side us = side_;
  const DirSetPair mask = moveMask(src, dst);

  swapMelee(pcSrc, src, pcDst, dst, 1);
  addShadow(pcSrc, src, us, -1);
  updateRanged(src, rangedDirs(pcSrc) & mask, ranged_[src] & mask, false);
  addShadow(pcDst, dst, us, 1);
  updateRangedMasked(dst, src, rangedDirs(pcDst), ranged_[dst], true);
}

void Position::effectByCapture(std::uint8_t src, std::uint8_t dst, Piece pcSrc, Piece pcDst, Piece pcCaptured) {
  const Side us = side_;
  const Side them = other(us);
  const DirSetPair mask = moveMask(src, dst);

  swapMelee(pcSrc, src, pcDst, dst, 1);
  addMelee(pcCaptured, dst, them, -1);
  addShadow(pcSrc, src, us, -1);
  addShadow(pcCaptured, dst, them, -1);
  updateRangedMasked(src, dst, rangedDirs(pcSrc) & mask, ranged_[src] & mask, false);
  addShadow(pcDst, dst, us, 1);
  updateRangedMasked(dst, src, rangedDirs(pcDst), rangedDirs(pcCaptured), true);
}

void Position::effectByDrop(Piece pc, std::uint8_t dst) {
  const Side us = side_;
  addMelee(pc, dst, us, 1);
  addShadow(pc, dst, us, 1);
  updateRanged(dst, rangedDirs(pc), ranged_[dst], true);
}

void Position::revertNoncapture(std::uint8_t src, std::uint8_t dst, Piece pcSrc, Piece pcDst) {
  const Side us = side_;
  const DirSetPair mask = moveMask(src, dst);

  swapMelee(pcSrc, src, pcDst, dst, -1);
  updateRangedMasked(dst, src, rangedDirs(pcDst), ranged_[dst], false);
  addShadow(pcDst, dst, us, -1);
  updateRanged(src, rangedDirs(pcSrc) & mask, ranged_[src] & mask, true);
  addShadow(pcSrc, src, us, 1);
}

void Position::revertCapture(std::uint8_t src, std::uint8_t dst, Piece pcSrc, Piece pcDst, Piece pcCaptured) {
  const Side us = side_;
  const Side them = other(us);
  const DirSetPair mask = moveMask(src, dst);

  swapMelee(pcSrc, src, pcDst, dst, -1);
  addMelee(pcCaptured, dst, them, 1);
  updateRangedMasked(dst, src, rangedDirs(pcDst), rangedDirs(pcCaptured), false);
  addShadow(pcDst, dst, us, -1);
  updateRangedMasked(src, dst, rangedDirs(pcSrc) & mask, ranged_[src] & mask, true);
  addShadow(pcSrc, src, us, 1);
  addShadow(pcCaptured, dst, them, 1);
}

void Position::revertDrop(Piece pc, std::uint8_t dst) {
  const Side us = side_;
  addMelee(pc, dst, us, -1);
  updateRanged(dst, rangedDirs(pc), ranged_[dst], false);
  addShadow(pc, dst, us, -1);
}

UndoableMove Position::doMove(const Move& m) {
  const Side us = side_;
  UndoableMove u;
  u.move = m;

  if (m.drop) {
    const PieceKind k = m.dropKind();
    assert(board_[m.dst] == NO_PIECE);
    assert(hands_[us][k] > 0);
    const Piece pc = makePiece(us, k);
    --hands_[us][k];
    putPiece(m.dst, pc);
    effectByDrop(pc, m.dst);
    u.pieceSrc = pc;
  } else {
    const Piece pcSrc = board_[m.src];
    const Piece pcCaptured = board_[m.dst];
    assert(pcSrc != NO_PIECE && pieceSide(pcSrc) == us);
    assert(pcCaptured == NO_PIECE || pieceSide(pcCaptured) != us);
    assert(pieceKind(pcCaptured) != KING);
    assert(!m.promo || isPromotable(pieceKind(pcSrc)));
    const Piece pcDst = m.promo ? makePiece(us, promoted(pieceKind(pcSrc))) : pcSrc;

    if (pcCaptured == NO_PIECE) {
      effectByNoncapture(m.src, m.dst, pcSrc, pcDst);
    } else {
      effectByCapture(m.src, m.dst, pcSrc, pcDst, pcCaptured);
      ++hands_[us][rawKind(pieceKind(pcCaptured))];
      removePiece(m.dst);
      if (us == HUM) --comNonkingCount_;
      else ++comNonkingCount_;
    }

    removePiece(m.src);
    putPiece(m.dst, pcDst);
    if (pieceKind(pcSrc) == KING) kingSq_[us] = m.dst;

    u.pieceSrc = pcSrc;
    u.pieceCaptured = pcCaptured;
  }

  side_ = other(side_);
  ++ply_;
  return u;
}

void Position::undoMove(const UndoableMove& u) {
  side_ = other(side_);
  --ply_;

  const Side us = side_;
  const Move& m = u.move;

  if (m.drop) {
    assert(board_[m.dst] == u.pieceSrc);
    removePiece(m.dst);
    ++hands_[us][m.dropKind()];
    revertDrop(u.pieceSrc, m.dst);
    return;
  }

  const Piece pcDst = u.pieceDst();
  assert(board_[m.src] == NO_PIECE && board_[m.dst] == pcDst);
  removePiece(m.dst);
  putPiece(m.src, u.pieceSrc);

  if (!u.isCapture()) {
    revertNoncapture(m.src, m.dst, u.pieceSrc, pcDst);
  } else {
    putPiece(m.dst, u.pieceCaptured);
    --hands_[us][rawKind(pieceKind(u.pieceCaptured))];
    revertCapture(m.src, m.dst, u.pieceSrc, pcDst, u.pieceCaptured);
    if (us == HUM) ++comNonkingCount_;
    else --comNonkingCount_;
  }

  if (pieceKind(u.pieceSrc) == KING) kingSq_[us] = m.src;
}

static std::string handString(const Hand& h) {
  std::string out;
  for (PieceKind k : HAND_KINDS) {
    if (h[k] == 0) continue;
    if (!out.empty()) out.push_back(' ');
    out += kindName(k);
    if (h[k] > 1) out += std::to_string(h[k]);
  }
  return out.empty() ? "-" : out;
}

std::string Position::pretty() const {
  std::ostringstream oss;
  oss << "COM hand: " << handString(hands_[COM]) << "\n";
  oss << "  9  8  7  6  5  4  3  2  1\n";
  for (int r = 0; r < N; ++r) {
    for (int c = N - 1; c >= 0; --c) {
      const Piece pc = board_[sq(c, r)];
      if (pc == NO_PIECE) {
        oss << " . ";
      } else {
        oss << (pieceSide(pc) == COM ? 'v' : ' ') << kindName(pieceKind(pc));
      }
    }
    oss << ' ' << (r + 1) << "\n";
  }
  oss << "HUM hand: " << handString(hands_[HUM]) << "\n";
  oss << "To move: " << sideName(side_) << "  Ply: " << ply_ << "\n";
  return oss.str();
}

std::string Position::prettyEffects(Side s) const {
  static constexpr char HEX[] = "0123456789ABCDEF";
  std::ostringstream oss;
  for (int r = 0; r < N; ++r) {
    for (int c = N - 1; c >= 0; --c) {
      const unsigned n = counts_[s][sq(c, r)];
      if (n < 16) oss << HEX[n];
      else oss << '[' << n << ']';
    }
    oss << "\n";
  }
  return oss.str();
}

} // namespace naitou
