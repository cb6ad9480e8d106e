#include "naitou/tables.hpp"

#include <algorithm>
#include <cstdlib>

namespace naitou {

// Mirror HUM directions into COM's point of view.
static constexpr DirSet flipVertical(DirSet d) {
  DirSet out = 0;
  for (int i = 0; i < 8; ++i) {
    if (!(d & dirBit(i))) continue;
    switch (i) {
      case DIR_RU: out |= dirBit(DIR_RD); break;
      case DIR_RD: out |= dirBit(DIR_RU); break;
      case DIR_U: out |= dirBit(DIR_D); break;
      case DIR_D: out |= dirBit(DIR_U); break;
      case DIR_LU: out |= dirBit(DIR_LD); break;
      case DIR_LD: out |= dirBit(DIR_LU); break;
      default: out |= dirBit(i); break;
    }
  }
  return out;
}

static constexpr DirSet DIRS_SILVER = dirBit(DIR_RU) | dirBit(DIR_U) | dirBit(DIR_LU) | dirBit(DIR_RD) | dirBit(DIR_LD);
static constexpr DirSet DIRS_GOLD = dirBit(DIR_RU) | dirBit(DIR_U) | dirBit(DIR_LU) | dirBit(DIR_R) | dirBit(DIR_L) | dirBit(DIR_D);

DirSet meleeDirs(Piece pc) {
  DirSet hum = 0;
  switch (pieceKind(pc)) {
    case PAWN: hum = dirBit(DIR_U); break;
    case SILVER: hum = DIRS_SILVER; break;
    case GOLD:
    case PRO_PAWN:
    case PRO_LANCE:
    case PRO_KNIGHT:
    case PRO_SILVER: hum = DIRS_GOLD; break;
    case KING: hum = DIRS_ALL; break;
    case HORSE: hum = DIRS_AXIS; break;
    case DRAGON: hum = DIRS_DIAG; break;
    default: return 0;
  }
  return (pieceSide(pc) == HUM) ? hum : flipVertical(hum);
}

DirSetPair rangedDirs(Piece pc) {
  if (pc == NO_PIECE) return 0;
  const Side s = pieceSide(pc);
  switch (pieceKind(pc)) {
    case LANCE: return dspPart(s, (s == HUM) ? dirBit(DIR_U) : dirBit(DIR_D));
    case BISHOP:
    case HORSE: return dspPart(s, DIRS_DIAG);
    case ROOK:
    case DRAGON: return dspPart(s, DIRS_AXIS);
    default: return 0;
  }
}

DirSet supportedDirs(Piece pc) {
  const PieceKind k = pieceKind(pc);
  if (pc == NO_PIECE || k == KNIGHT || k == KING) return 0;
  return meleeDirs(pc) | dspGet(rangedDirs(pc), pieceSide(pc));
}

static Tables buildTables() {
  Tables t{};

  for (int c = 0; c < N; ++c) {
    for (int r = 0; r < N; ++r) {
      const std::uint8_t s = sq(c, r);
      t.colMask[c].set(s);
      t.rowMask[r].set(s);
      if (r <= 2) t.promotionZone[HUM].set(s);
      if (r >= 6) t.promotionZone[COM].set(s);

      for (int d = 0; d < 8; ++d) {
        const int cc = c + DIR_DC[d];
        const int rr = r + DIR_DR[d];
        t.next[s][d] = inBounds(cc, rr) ? sq(cc, rr) : SQ_NONE;
        if (inBounds(cc, rr)) t.kingEffect[s].set(sq(cc, rr));
      }

      for (int dc = -2; dc <= 2; ++dc) {
        for (int dr = -2; dr <= 2; ++dr) {
          if (inBounds(c + dc, r + dr)) t.around25[s].set(sq(c + dc, r + dr));
        }
      }

      for (int dc : {-1, 1}) {
        if (inBounds(c + dc, r - 2)) t.knightEffect[HUM][s].set(sq(c + dc, r - 2));
        if (inBounds(c + dc, r + 2)) t.knightEffect[COM][s].set(sq(c + dc, r + 2));
      }
    }
  }

  for (std::uint8_t src = 0; src < SQ_N; ++src) {
    for (int d = 0; d < 8; ++d) {
      for (std::uint8_t dst = t.next[src][d]; dst != SQ_NONE; dst = t.next[dst][d]) {
        t.between[src][dst] = dirBit(d);
      }
    }
  }

  for (Side side : {HUM, COM}) {
    for (int k = PAWN; k <= DRAGON; ++k) {
      const Piece pc = makePiece(side, static_cast<PieceKind>(k));
      const DirSet dirs = meleeDirs(pc);
      for (std::uint8_t s = 0; s < SQ_N; ++s) {
        if (k == KNIGHT) {
          t.melee[pc][s] = t.knightEffect[side][s];
          continue;
        }
        for (int d = 0; d < 8; ++d) {
          if ((dirs & dirBit(d)) && t.next[s][d] != SQ_NONE) t.melee[pc][s].set(t.next[s][d]);
        }
      }
    }
  }

  return t;
}

const Tables& tables() {
  static const Tables t = buildTables();
  return t;
}

Bitboard81 slideEffect(std::uint8_t s, DirSet dirs, Bitboard81 occ) {
  const Tables& t = tables();
  Bitboard81 out;
  for (int d = 0; d < 8; ++d) {
    if (!(dirs & dirBit(d))) continue;
    for (std::uint8_t x = t.next[s][d]; x != SQ_NONE; x = t.next[x][d]) {
      out.set(x);
      if (occ.test(x)) break;
    }
  }
  return out;
}

Bitboard81 effect(Piece pc, std::uint8_t s, Bitboard81 occ) {
  const DirSet ranged = dspGet(rangedDirs(pc), pieceSide(pc));
  Bitboard81 out = meleeEffect(pc, s);
  if (ranged) out |= slideEffect(s, ranged, occ);
  return out;
}

int distance(std::uint8_t a, std::uint8_t b) {
  return std::max(std::abs(col(a) - col(b)), std::abs(row(a) - row(b)));
}

Bitboard81 farRows(Side s, int n) {
  const Tables& t = tables();
  Bitboard81 out;
  for (int i = 0; i < n; ++i) out |= t.rowMask[(s == HUM) ? i : N - 1 - i];
  return out;
}

Bitboard81 pawnDropMask(Side s, Bitboard81 pawns) {
  const Tables& t = tables();
  Bitboard81 out;
  for (int c = 0; c < N; ++c) {
    if ((t.colMask[c] & pawns).empty()) out |= t.colMask[c];
  }
  return out.andNot(farRows(s, 1));
}

} // namespace naitou
