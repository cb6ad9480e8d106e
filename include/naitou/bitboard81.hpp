#pragma once

#include <bit>
#include <cstdint>

#include "naitou/core.hpp"

namespace naitou {

// Set of board squares. Squares are numbered file by file (9 * col + row), and
// the two words split the board between files 7 and 8: files 1..7 sit in bits
// 0..62 of `low`, files 8 and 9 in bits 0..17 of `high`. A file never straddles
// the words, and iteration still runs in increasing square order.
struct Bitboard81 {
  static constexpr int SPLIT = 7 * N; // first square kept in `high`
  static constexpr std::uint64_t LOW_MASK = (1ULL << SPLIT) - 1;
  static constexpr std::uint64_t HIGH_MASK = (1ULL << (SQ_N - SPLIT)) - 1;

  std::uint64_t low = 0;
  std::uint64_t high = 0;

  [[nodiscard]] static constexpr Bitboard81 all() { return Bitboard81{LOW_MASK, HIGH_MASK}; }
  [[nodiscard]] static constexpr Bitboard81 of(std::uint8_t s) {
    Bitboard81 b;
    b.set(s);
    return b;
  }

  [[nodiscard]] constexpr bool empty() const { return (low | high) == 0; }
  [[nodiscard]] constexpr bool any() const { return (low | high) != 0; }

  // SQ_NONE is never a member; set and reset ignore it.
  [[nodiscard]] constexpr bool test(std::uint8_t s) const {
    if (s == SQ_NONE) return false;
    return (word(s) & bit(s)) != 0;
  }
  constexpr void set(std::uint8_t s) {
    if (s != SQ_NONE) word(s) |= bit(s);
  }
  constexpr void reset(std::uint8_t s) {
    if (s != SQ_NONE) word(s) &= ~bit(s);
  }
  // s must be a board square.
  constexpr void toggle(std::uint8_t s) { word(s) ^= bit(s); }

  [[nodiscard]] constexpr std::uint32_t popcount() const {
    return static_cast<std::uint32_t>(std::popcount(low) + std::popcount(high));
  }

  [[nodiscard]] constexpr Bitboard81 operator|(Bitboard81 o) const { return Bitboard81{low | o.low, high | o.high}; }
  [[nodiscard]] constexpr Bitboard81 operator&(Bitboard81 o) const { return Bitboard81{low & o.low, high & o.high}; }
  [[nodiscard]] constexpr Bitboard81 operator^(Bitboard81 o) const { return Bitboard81{low ^ o.low, high ^ o.high}; }
  [[nodiscard]] constexpr Bitboard81 operator~() const { return Bitboard81{~low & LOW_MASK, ~high & HIGH_MASK}; }
  [[nodiscard]] constexpr Bitboard81 andNot(Bitboard81 o) const { return Bitboard81{low & ~o.low, high & ~o.high}; }

  constexpr Bitboard81& operator|=(Bitboard81 o) { return *this = *this | o; }
  constexpr Bitboard81& operator&=(Bitboard81 o) { return *this = *this & o; }
  constexpr Bitboard81& operator^=(Bitboard81 o) { return *this = *this ^ o; }

  [[nodiscard]] constexpr bool operator==(const Bitboard81& o) const = default;

  // Removes and returns the lowest square. The set must not be empty.
  [[nodiscard]] std::uint8_t pop_lsb() {
    if (low != 0) {
      const int s = std::countr_zero(low);
      low &= low - 1;
      return static_cast<std::uint8_t>(s);
    }
    const int s = std::countr_zero(high);
    high &= high - 1;
    return static_cast<std::uint8_t>(s + SPLIT);
  }

private:
  [[nodiscard]] static constexpr std::uint64_t bit(std::uint8_t s) {
    return 1ULL << (s < SPLIT ? s : s - SPLIT);
  }
  [[nodiscard]] constexpr std::uint64_t word(std::uint8_t s) const { return s < SPLIT ? low : high; }
  [[nodiscard]] constexpr std::uint64_t& word(std::uint8_t s) { return s < SPLIT ? low : high; }
};

} // namespace naitou
