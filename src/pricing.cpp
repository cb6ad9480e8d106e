#include "naitou/pricing.hpp"

#include <algorithm>

#include "naitou/tables.hpp"

namespace naitou {

int naitouDistance(std::uint8_t from, std::uint8_t to) {
  if (from != SQ_NONE) return distance(from, to);
  const int dx = 1 + (N - 1) - col(to);
  const int dy = (N - 1) - row(to);
  return std::max(dx, dy);
}

PieceKind naitouAttacker(const Position& pos, Side us, std::uint8_t s) {
  const Side them = other(us);
  PieceKind best = NO_KIND;
  std::uint8_t bestValue = naitouSquareValue(sqAt(1, 1));

  for (int k = PAWN; k <= DRAGON; ++k) {
    const auto pk = static_cast<PieceKind>(k);
    Bitboard81 bb = effect(makePiece(them, pk), s, pos.occupied()) & pos.pieces(us, pk);
    while (bb.any()) {
      const std::uint8_t value = naitouSquareValue(bb.pop_lsb());
      if (PRICE_A[pk] < PRICE_A[best] || (PRICE_A[pk] == PRICE_A[best] && value < bestValue)) {
        best = pk;
        bestValue = value;
      }
    }
  }
  return best;
}

std::uint8_t comDropSrcValue(PieceKind k) {
  switch (k) {
    case PAWN: return 201;
    case LANCE: return 202;
    case KNIGHT: return 203;
    case SILVER: return 204;
    case GOLD: return 205;
    case BISHOP: return 206;
    case ROOK: return 207;
    default: return 0;
  }
}

} // namespace naitou
