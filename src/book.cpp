#include "naitou/book.hpp"

#include <bit>
#include <span>

namespace naitou {

namespace {

// Squares are written as two digits: file then rank.
constexpr std::uint8_t at(int fileRank) {
  return sqAt(fileRank / 10, fileRank % 10);
}

struct BranchRule {
  std::uint8_t sq;
  PieceKind kind;
  bool switches; // formation change instead of a reply
  Formation formation;
  std::uint8_t maxPly;
  std::uint8_t src;
  std::uint8_t dst;

  [[nodiscard]] bool humPieceThere(const Position& pos) const { return pos.at(sq) == makePiece(HUM, kind); }
};

constexpr BranchRule reply(int s, PieceKind k, int src, int dst) {
  return BranchRule{at(s), k, false, Formation::Nothing, 0, at(src), at(dst)};
}

constexpr BranchRule switchTo(int s, PieceKind k, Formation f, std::uint8_t maxPly) {
  return BranchRule{at(s), k, true, f, maxPly, SQ_NONE, SQ_NONE};
}

struct BookStep {
  std::uint8_t src;
  std::uint8_t dst;
};

constexpr BookStep step(int src, int dst) {
  return BookStep{at(src), at(dst)};
}

constexpr BranchRule BRANCH_NAKABISHA[] = {
  switchTo(22, BISHOP, Formation::Kakugawari, 5),
  switchTo(22, HORSE, Formation::Kakugawari, 5),
  reply(55, BISHOP, 53, 54),
  reply(46, BISHOP, 44, 45),
  reply(46, SILVER, 44, 45),
  reply(26, SILVER, 41, 32),
  reply(46, PAWN, 22, 33),
  reply(96, PAWN, 93, 94),
  reply(25, PAWN, 22, 33),
  reply(35, SILVER, 44, 45),
};

constexpr BranchRule BRANCH_SIKENBISHA[] = {
  switchTo(22, BISHOP, Formation::Kakugawari, 5),
  switchTo(22, HORSE, Formation::Kakugawari, 5),
  reply(55, BISHOP, 53, 54),
  reply(46, BISHOP, 44, 45),
  reply(46, SILVER, 44, 45),
  reply(26, SILVER, 42, 32),
  reply(46, PAWN, 22, 33),
  reply(96, PAWN, 93, 94),
  reply(25, PAWN, 22, 33),
  reply(35, SILVER, 44, 45),
};

constexpr BranchRule BRANCH_KAKUGAWARI[] = {
  switchTo(45, BISHOP, Formation::Sujichigai, 5),
  switchTo(56, BISHOP, Formation::Sujichigai, 5),
  reply(96, PAWN, 93, 94),
};

constexpr BranchRule BRANCH_SUJICHIGAI[] = {
  reply(96, PAWN, 93, 94),
  reply(16, PAWN, 13, 14),
};

constexpr BranchRule BRANCH_HUM_HISHAOCHI[] = {
  reply(16, PAWN, 13, 14),
  reply(96, PAWN, 93, 94),
  reply(22, BISHOP, 31, 22),
  reply(22, HORSE, 31, 22),
};

constexpr BranchRule BRANCH_HUM_NIMAIOCHI[] = {
  reply(56, PAWN, 53, 54),
};

constexpr BranchRule BRANCH_COM_HISHAOCHI[] = {
  reply(25, PAWN, 22, 33),
  reply(96, PAWN, 93, 94),
  reply(16, PAWN, 13, 14),
};

constexpr BranchRule BRANCH_COM_NIMAIOCHI[] = {
  reply(16, PAWN, 13, 14),
  reply(96, PAWN, 93, 94),
  reply(56, PAWN, 53, 54),
  reply(35, PAWN, 31, 22),
};

constexpr BookStep MOVES_NAKABISHA[] = {
  step(33, 34), step(43, 44), step(31, 42), step(82, 52), step(42, 43), step(51, 62),
  step(62, 72), step(71, 62), step(22, 33), step(53, 54), step(63, 64), step(62, 63),
  step(61, 62), step(41, 42), step(42, 53), step(52, 22), step(23, 24), step(24, 25),
  step(44, 45),
};

constexpr BookStep MOVES_SIKENBISHA[] = {
  step(33, 34), step(43, 44), step(31, 32), step(82, 42), step(32, 43), step(51, 62),
  step(62, 72), step(72, 82), step(71, 72), step(41, 52), step(22, 33), step(63, 64),
  step(52, 63), step(73, 74), step(42, 41), step(93, 94), step(44, 45),
};

constexpr BookStep MOVES_KAKUGAWARI[] = {
  step(33, 34), step(31, 22), step(22, 33), step(71, 62), step(83, 84), step(41, 32),
  step(84, 85), step(61, 52), step(51, 41), step(63, 64), step(62, 63), step(73, 74),
  step(41, 31), step(31, 22), step(43, 44), step(52, 43), step(93, 94), step(81, 73),
  step(64, 65), step(63, 54),
};

constexpr BookStep MOVES_SUJICHIGAI[] = {
  step(33, 34), step(31, 22), step(61, 52), step(41, 32), step(22, 33), step(71, 62),
  step(83, 84), step(84, 85), step(51, 41), step(63, 64), step(62, 63), step(53, 54),
  step(73, 74), step(81, 73), step(93, 94), step(13, 14), step(33, 44), step(64, 65),
};

constexpr BookStep MOVES_HUM_HISHAOCHI[] = {
  step(33, 34), step(83, 84), step(84, 85), step(41, 32), step(71, 62), step(61, 52),
  step(51, 41), step(53, 54), step(73, 74), step(31, 42), step(63, 64), step(62, 63),
  step(81, 73), step(93, 94), step(13, 14), step(22, 33), step(64, 65),
};

constexpr BookStep MOVES_HUM_NIMAIOCHI[] = {
  step(33, 34), step(63, 64), step(64, 65), step(82, 62), step(73, 74), step(74, 75),
  step(71, 72), step(72, 73), step(41, 32), step(61, 52), step(51, 41), step(31, 42),
  step(53, 54), step(73, 74), step(81, 73), step(93, 94), step(13, 14), step(62, 61),
  step(75, 76),
};

constexpr BookStep MOVES_COM_HISHAOCHI[] = {
  step(33, 34), step(43, 44), step(41, 32), step(31, 42), step(42, 43), step(51, 62),
  step(62, 72), step(71, 62), step(53, 54), step(13, 14), step(93, 94), step(63, 64),
  step(62, 63), step(61, 62), step(73, 74), step(22, 33),
};

constexpr BookStep MOVES_COM_NIMAIOCHI[] = {
  step(41, 32), step(71, 62), step(53, 54), step(62, 53), step(61, 62), step(63, 64),
  step(62, 63), step(73, 74), step(51, 62), step(13, 14), step(93, 94), step(81, 73),
  step(31, 42), step(64, 65),
};

struct FormationBook {
  std::span<const BranchRule> branches;
  std::span<const BookStep> moves;
};

FormationBook bookOf(Formation f) {
  switch (f) {
    case Formation::Nakabisha: return {BRANCH_NAKABISHA, MOVES_NAKABISHA};
    case Formation::Sikenbisha: return {BRANCH_SIKENBISHA, MOVES_SIKENBISHA};
    case Formation::Kakugawari: return {BRANCH_KAKUGAWARI, MOVES_KAKUGAWARI};
    case Formation::Sujichigai: return {BRANCH_SUJICHIGAI, MOVES_SUJICHIGAI};
    case Formation::HumHishaochi: return {BRANCH_HUM_HISHAOCHI, MOVES_HUM_HISHAOCHI};
    case Formation::HumNimaiochi: return {BRANCH_HUM_NIMAIOCHI, MOVES_HUM_NIMAIOCHI};
    case Formation::ComHishaochi: return {BRANCH_COM_HISHAOCHI, MOVES_COM_HISHAOCHI};
    case Formation::ComNimaiochi: return {BRANCH_COM_NIMAIOCHI, MOVES_COM_NIMAIOCHI};
    case Formation::Nothing: break;
  }
  return {};
}

constexpr std::uint32_t lowMask(std::size_t n) {
  return static_cast<std::uint32_t>((1ULL << n) - 1);
}

} // namespace

std::string_view formationName(Formation f) {
  switch (f) {
    case Formation::Nakabisha: return "Nakabisha";
    case Formation::Sikenbisha: return "Sikenbisha";
    case Formation::Kakugawari: return "Kakugawari";
    case Formation::Sujichigai: return "Sujichigai";
    case Formation::HumHishaochi: return "HumHishaochi";
    case Formation::HumNimaiochi: return "HumNimaiochi";
    case Formation::ComHishaochi: return "ComHishaochi";
    case Formation::ComNimaiochi: return "ComNimaiochi";
    case Formation::Nothing: break;
  }
  return "Nothing";
}

Formation initialFormation(Handicap h) {
  switch (h) {
    case Handicap::HumSenteSikenbisha:
    case Handicap::ComSenteSikenbisha: return Formation::Sikenbisha;
    case Handicap::HumSenteNakabisha:
    case Handicap::ComSenteNakabisha: return Formation::Nakabisha;
    case Handicap::HumHishaochi: return Formation::HumHishaochi;
    case Handicap::HumNimaiochi: return Formation::HumNimaiochi;
    case Handicap::ComHishaochi: return Formation::ComHishaochi;
    case Handicap::ComNimaiochi: return Formation::ComNimaiochi;
  }
  return Formation::Nothing;
}

BookState::BookState(Formation f) {
  changeFormation(f);
}

void BookState::changeFormation(Formation f) {
  formation_ = f;
  const FormationBook book = bookOf(f);
  unusedBranches_ = lowMask(book.branches.size());
  unusedMoves_ = lowMask(book.moves.size());
}

std::optional<Move> BookState::nextMove(const Position& pos, int progressPly) {
  if (formation_ == Formation::Nothing) return std::nullopt;

  bool rescan = true;
  while (rescan) {
    rescan = false;
    const FormationBook book = bookOf(formation_);
    for (std::uint32_t bits = unusedBranches_; bits != 0; bits &= bits - 1) {
      const int i = std::countr_zero(bits);
      const BranchRule& rule = book.branches[static_cast<std::size_t>(i)];
      if (!rule.humPieceThere(pos)) continue;

      if (rule.switches) {
        if (progressPly > rule.maxPly) continue;
        changeFormation(rule.formation);
        rescan = true;
        break;
      }
      if (progressPly != 0) unusedBranches_ &= ~(1u << i);
      return Move::walk(rule.src, rule.dst);
    }
  }

  if (unusedMoves_ != 0) {
    const int i = std::countr_zero(unusedMoves_);
    const BookStep& s = bookOf(formation_).moves[static_cast<std::size_t>(i)];
    if (progressPly != 0) unusedMoves_ &= ~(1u << i);
    return Move::walk(s.src, s.dst);
  }

  formation_ = Formation::Nothing;
  return std::nullopt;
}

} // namespace naitou
