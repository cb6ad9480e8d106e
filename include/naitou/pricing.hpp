#pragma once

#include <array>
#include <cstdint>

#include "naitou/core.hpp"
#include "naitou/position.hpp"

namespace naitou {

// Naitou values pieces with four slightly different tables,
// each used in specific places of its evaluation.
using PriceTable = std::array<std::uint8_t, KIND_N>;

//                                  -   P  L  N  S  B   R   G  K   +P +L +N +S H   D
constexpr PriceTable PRICE_A = {255, 1, 4, 4, 8, 16, 17, 8, 40, 2, 5, 6, 8, 20, 22};
constexpr PriceTable PRICE_B = {255, 1, 4, 4, 8, 16, 17, 8, 40, 8, 8, 8, 8, 22, 22};
constexpr PriceTable PRICE_C = {255, 1, 4, 4, 8, 16, 17, 8, 40, 2, 8, 8, 8, 22, 22};
constexpr PriceTable PRICE_D = {255, 1, 4, 4, 8, 16, 17, 8, 40, 1, 4, 4, 8, 20, 22};

// Rank-major, file 9 first: 11 * rank + (10 - file). Scanning squares in
// increasing value is Naitou's board order.
[[nodiscard]] constexpr std::uint8_t naitouSquareValue(std::uint8_t s) {
  return static_cast<std::uint8_t>(11 * (row(s) + 1) + (N - col(s)));
}

// All squares by increasing naitouSquareValue.
[[nodiscard]] constexpr std::array<std::uint8_t, SQ_N> naitouSquares() {
  std::array<std::uint8_t, SQ_N> out{};
  int i = 0;
  for (int r = 0; r < N; ++r) {
    for (int c = N - 1; c >= 0; --c) out[i++] = sq(c, r);
  }
  return out;
}

// Chebyshev distance; a missing first square (SQ_NONE) sits just off the
// board beyond file 9, rank 9.
[[nodiscard]] int naitouDistance(std::uint8_t from, std::uint8_t to);

// Cheapest piece of `us` attacking s (by PRICE_A, ties to the lower square
// value), or NO_KIND. Shadow effects do not count.
[[nodiscard]] PieceKind naitouAttacker(const Position& pos, Side us, std::uint8_t s);

// Pseudo source value Naitou records for a COM drop.
[[nodiscard]] std::uint8_t comDropSrcValue(PieceKind k);

} // namespace naitou
