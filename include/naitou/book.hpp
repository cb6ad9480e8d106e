#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "naitou/handicap.hpp"
#include "naitou/move.hpp"
#include "naitou/position.hpp"

namespace naitou {

// Opening formations of the book. Nothing means COM has left the book.
enum class Formation : std::uint8_t {
  Nakabisha,
  Sikenbisha,
  Kakugawari,
  Sujichigai,
  HumHishaochi,
  HumNimaiochi,
  ComHishaochi,
  ComNimaiochi,
  Nothing,
};

[[nodiscard]] std::string_view formationName(Formation f);
[[nodiscard]] Formation initialFormation(Handicap h);

// Book progress: the current formation and which of its branch rules and
// sequence moves are still unused. Rules are tried in table order.
//
// A branch rule either answers a HUM piece standing on a given square with a
// fixed COM move, or (up to a given progress ply) switches the formation and
// restarts the branch scan. When no rule fires, the next unused sequence move
// is proposed. Entries proposed at progress ply 0 stay unused, so COM's first
// move in a COM-first game is proposed again later.
class BookState {
public:
  explicit BookState(Formation f);

  [[nodiscard]] Formation formation() const { return formation_; }

  // Next candidate book move, or nullopt once the book is exhausted (the
  // formation then becomes Nothing). Candidates are not checked for legality.
  [[nodiscard]] std::optional<Move> nextMove(const Position& pos, int progressPly);

  [[nodiscard]] bool operator==(const BookState& o) const = default;

private:
  Formation formation_ = Formation::Nothing;
  std::uint32_t unusedBranches_ = 0;
  std::uint32_t unusedMoves_ = 0;

  void changeFormation(Formation f);
};

} // namespace naitou
