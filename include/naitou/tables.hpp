#pragma once

#include <array>
#include <cstdint>

#include "naitou/bitboard81.hpp"
#include "naitou/core.hpp"

namespace naitou {

struct Tables {
  // Neighbour of each square per direction, SQ_NONE when off board.
  std::array<std::array<std::uint8_t, 8>, SQ_N> next{};

  // Single direction bit from src toward dst when dst lies on a line from
  // src, 0 otherwise (including knight jumps).
  std::array<std::array<DirSet, SQ_N>, SQ_N> between{};

  // Non-sliding effect of every piece (indexed by Piece value).
  std::array<std::array<Bitboard81, SQ_N>, 32> melee{};

  std::array<std::array<Bitboard81, SQ_N>, 2> knightEffect{};
  std::array<Bitboard81, SQ_N> kingEffect{};
  std::array<Bitboard81, SQ_N> around25{}; // Chebyshev distance <= 2, centre included

  std::array<Bitboard81, N> colMask{};
  std::array<Bitboard81, N> rowMask{};
  std::array<Bitboard81, 2> promotionZone{};
};

[[nodiscard]] const Tables& tables();

// Directions in which a piece extends a friendly ray resting on it by one
// more square (the "shadow" effect).
[[nodiscard]] DirSet supportedDirs(Piece pc);
[[nodiscard]] DirSetPair rangedDirs(Piece pc);
[[nodiscard]] DirSet meleeDirs(Piece pc);

[[nodiscard]] inline Bitboard81 meleeEffect(Piece pc, std::uint8_t s) {
  return tables().melee[pc][s];
}

// Squares reached by sliding from s along dirs; the first blocker is included.
[[nodiscard]] Bitboard81 slideEffect(std::uint8_t s, DirSet dirs, Bitboard81 occ);

// Full effect of pc standing on s.
[[nodiscard]] Bitboard81 effect(Piece pc, std::uint8_t s, Bitboard81 occ);

[[nodiscard]] inline Bitboard81 queenEffect(std::uint8_t s, Bitboard81 occ) {
  return slideEffect(s, DIRS_ALL, occ);
}

[[nodiscard]] inline DirSet dirBetween(std::uint8_t src, std::uint8_t dst) {
  return tables().between[src][dst];
}

[[nodiscard]] int distance(std::uint8_t a, std::uint8_t b);

// Last rank(s) a piece of side s may not be dropped on: rows 0..n-1 for HUM.
[[nodiscard]] Bitboard81 farRows(Side s, int n);

// Drop squares for a pawn of side s, given that side's pawns on board.
[[nodiscard]] Bitboard81 pawnDropMask(Side s, Bitboard81 pawns);

[[nodiscard]] constexpr bool inPromotionZone(Side s, std::uint8_t sq) {
  return (s == HUM) ? row(sq) <= 2 : row(sq) >= 6;
}

} // namespace naitou
