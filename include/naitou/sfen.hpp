#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "naitou/core.hpp"
#include "naitou/move.hpp"
#include "naitou/position.hpp"

namespace naitou {

// A start position plus the moves played from it.
struct SfenGame {
  Side sideToMove = HUM;
  Board board{};
  Hands hands{};
  std::vector<Move> moves;

  [[nodiscard]] Position position() const { return Position(sideToMove, board, hands); }
};

// Accepts "[position] startpos [moves ...]" and
// "[position] sfen <board> <b|w> <hands|-> <ply> [moves ...]".
// Throws std::runtime_error("Invalid SFEN: ...") on malformed text. Moves are
// only checked for syntax.
[[nodiscard]] SfenGame decodeSfen(std::string_view text);

[[nodiscard]] std::string encodeSfenPosition(Side sideToMove, const Board& board, const Hands& hands);
[[nodiscard]] std::string encodeSfen(Side sideToMove, const Board& board, const Hands& hands,
                                     const std::vector<Move>& moves);

} // namespace naitou
