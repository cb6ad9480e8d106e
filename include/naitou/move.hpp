#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "naitou/core.hpp"

namespace naitou {

struct Move {
  std::uint8_t src = SQ_NONE; // dropped PieceKind for drops
  std::uint8_t dst = SQ_NONE;
  bool drop = false;
  bool promo = false;

  [[nodiscard]] static constexpr Move walk(std::uint8_t from, std::uint8_t to, bool promote = false) {
    return Move{from, to, false, promote};
  }
  [[nodiscard]] static constexpr Move dropOf(PieceKind k, std::uint8_t to) {
    return Move{static_cast<std::uint8_t>(k), to, true, false};
  }

  [[nodiscard]] constexpr PieceKind dropKind() const { return static_cast<PieceKind>(src); }
  [[nodiscard]] constexpr bool isNull() const { return dst == SQ_NONE; }

  [[nodiscard]] constexpr bool operator==(const Move& o) const = default;
};

[[nodiscard]] constexpr Move nullMove() { return Move{}; }

// A move together with what is needed to take it back.
struct UndoableMove {
  Move move;
  Piece pieceSrc = NO_PIECE; // the dropped piece for drops
  Piece pieceCaptured = NO_PIECE;

  [[nodiscard]] constexpr Piece pieceDst() const {
    return move.promo ? makePiece(pieceSide(pieceSrc), promoted(pieceKind(pieceSrc))) : pieceSrc;
  }
  [[nodiscard]] constexpr bool isCapture() const { return pieceCaptured != NO_PIECE; }
};

// SFEN move token: "7g7f", "2b8h+", "P*5e".
[[nodiscard]] std::string moveToString(const Move& m);
[[nodiscard]] std::optional<Move> parseMoveToken(std::string_view tok);

} // namespace naitou
