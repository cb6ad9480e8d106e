#pragma once

#include "naitou/position.hpp"

namespace naitou {

// Pseudo-legal moves for the side to move. Moves may leave the own king in
// check; callers filter with isChecked after doMove. The order is fixed:
// pawn moves, then pieces by kind (lance, knight, silver, bishop, rook, gold,
// king, promoted pieces), then drops. Within a group, source squares and then
// destination squares ascend.
void generateMoves(const Position& pos, MoveList& out);

// Replies to check: king steps to squares the enemy does not attack, then
// moves and drops onto the checking knight or the lines through the king.
void generateEvasions(const Position& pos, MoveList& out);

// Non-drop moves that capture an enemy piece.
void generateCaptures(const Position& pos, MoveList& out);

// Side to move must be in check. Pawn-drop mates count as mate. The Naitou
// variant only tries drops next to HUM's king, as COM's mate test does.
[[nodiscard]] bool isCheckmated(Position& pos);
[[nodiscard]] bool isCheckmatedNaitou(Position& pos);

// COM's candidate moves in Naitou's scan order: rank 1 to 9,
// file 9 to 1 within a rank. COM always promotes when it may.
void generateMovesCom(const Position& pos, MoveList& out);

} // namespace naitou
