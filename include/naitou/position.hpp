#pragma once

#include <array>
#include <cassert>
#include <cstdint>
#include <string>

#include "naitou/bitboard81.hpp"
#include "naitou/core.hpp"
#include "naitou/move.hpp"

namespace naitou {

struct MoveList {
  // 593 is the largest known number of legal moves in a shogi position.
  std::array<Move, 600> buf;
  std::uint32_t size = 0;

  void clear() { size = 0; }
  [[nodiscard]] bool empty() const { return size == 0; }
  void push(const Move& m) {
    assert(size < buf.size());
    buf[size++] = m;
  }

  [[nodiscard]] const Move* begin() const { return buf.data(); }
  [[nodiscard]] const Move* end() const { return buf.data() + size; }
};

using EffectCounts = std::array<std::uint8_t, SQ_N>;
using RangedEffects = std::array<DirSetPair, SQ_N>;

// Board, hands and the effect boards of both sides. Effects are kept up to
// date incrementally by doMove/undoMove and count the shadow effect of
// ranged pieces, so they match what Naitou computes rather
// than plain shogi attack counts.
class Position {
public:
  // No legality checks. Both kings must be on the board.
  Position(Side toMove, const Board& board, const Hands& hands);

  [[nodiscard]] static Position even();

  [[nodiscard]] Side sideToMove() const { return side_; }
  [[nodiscard]] int ply() const { return ply_; }

  [[nodiscard]] const Board& board() const { return board_; }
  [[nodiscard]] Piece at(std::uint8_t s) const { return board_[s]; }
  [[nodiscard]] const Hands& hands() const { return hands_; }
  [[nodiscard]] std::uint8_t hand(Side s, PieceKind k) const { return hands_[s][k]; }

  [[nodiscard]] Bitboard81 occupied() const { return occ_; }
  [[nodiscard]] Bitboard81 occupiedBy(Side s) const { return occSide_[s]; }
  [[nodiscard]] Bitboard81 kindBB(PieceKind k) const { return kindBB_[k]; }
  [[nodiscard]] Bitboard81 pieces(Side s, PieceKind k) const { return occSide_[s] & kindBB_[k]; }
  [[nodiscard]] Bitboard81 blanks() const { return ~occ_; }

  [[nodiscard]] std::uint8_t kingSq(Side s) const { return kingSq_[s]; }

  [[nodiscard]] const EffectCounts& effectCounts(Side s) const { return counts_[s]; }
  [[nodiscard]] std::uint8_t effectCount(Side s, std::uint8_t sq) const { return counts_[s][sq]; }
  [[nodiscard]] const RangedEffects& rangedEffects() const { return ranged_; }

  // Pieces COM owns besides its king, on board and in hand.
  [[nodiscard]] std::uint32_t comNonkingCount() const { return comNonkingCount_; }

  [[nodiscard]] bool isChecked(Side us) const { return counts_[other(us)][kingSq_[us]] > 0; }

  // m must be pseudo-legal for the side to move and must not capture a king.
  UndoableMove doMove(const Move& m);
  void undoMove(const UndoableMove& u);

  [[nodiscard]] std::string pretty() const;
  [[nodiscard]] std::string prettyEffects(Side s) const;

  [[nodiscard]] bool operator==(const Position& o) const = default;

private:
  Board board_{};
  Hands hands_{};
  Side side_ = HUM;
  int ply_ = 1;

  Bitboard81 occ_{};
  std::array<Bitboard81, 2> occSide_{};
  std::array<Bitboard81, KIND_N> kindBB_{};
  std::array<std::uint8_t, 2> kingSq_{0, 0};
  std::uint32_t comNonkingCount_ = 0;

  std::array<EffectCounts, 2> counts_{};
  RangedEffects ranged_{};

  void putPiece(std::uint8_t s, Piece pc);
  void removePiece(std::uint8_t s);
  void xorPiece(std::uint8_t s, Piece pc);

  void rebuildEffects();

  void bump(Side side, std::uint8_t s, int delta) {
    counts_[side][s] = static_cast<std::uint8_t>(counts_[side][s] + delta);
  }
  void addMelee(Piece pc, std::uint8_t s, Side side, int delta);
  void swapMelee(Piece pcSrc, std::uint8_t src, Piece pcDst, std::uint8_t dst, int delta);
  void addShadow(Piece pc, std::uint8_t s, Side side, int delta);
  void updateRanged(std::uint8_t s, DirSetPair dspUs, DirSetPair dspOthers, bool put);
  void updateRangedMasked(std::uint8_t s, std::uint8_t placeholderSq, DirSetPair dspUs, DirSetPair dspOthers, bool put);

  void effectByNoncapture(std::uint8_t src, std::uint8_t dst, Piece pcSrc, Piece pcDst);
  void effectByCapture(std::uint8_t src, std::uint8_t dst, Piece pcSrc, Piece pcDst, Piece pcCaptured);
  void effectByDrop(Piece pc, std::uint8_t dst);
  void revertNoncapture(std::uint8_t src, std::uint8_t dst, Piece pcSrc, Piece pcDst);
  void revertCapture(std::uint8_t src, std::uint8_t dst, Piece pcSrc, Piece pcDst, Piece pcCaptured);
  void revertDrop(Piece pc, std::uint8_t dst);
};

} // namespace naitou
