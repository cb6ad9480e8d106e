#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "naitou/sfen.hpp"

namespace naitou {

// Game setups of Naitou. The even game comes in two flavours
// because its time-limit setting selects the opening book.
enum class Handicap : std::uint8_t {
  HumSenteSikenbisha,
  HumSenteNakabisha,
  HumHishaochi,
  HumNimaiochi,
  ComSenteSikenbisha,
  ComSenteNakabisha,
  ComHishaochi,
  ComNimaiochi,
};

[[nodiscard]] std::string_view handicapName(Handicap h);
[[nodiscard]] std::optional<Handicap> parseHandicap(std::string_view name);

// Start position of the setup (no moves).
[[nodiscard]] SfenGame handicapStart(Handicap h);

[[nodiscard]] inline bool comMovesFirst(Handicap h) {
  return handicapStart(h).sideToMove == COM;
}

// Maps a start position back to its setup; nullopt if none matches.
[[nodiscard]] std::optional<Handicap> handicapFromStart(Side sideToMove, const Board& board, const Hands& hands,
                                                        bool timelimit);

} // namespace naitou
