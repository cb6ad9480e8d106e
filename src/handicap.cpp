#include "naitou/handicap.hpp"

#include <array>

namespace naitou {

namespace {

struct HandicapInfo {
  Handicap handicap;
  std::string_view name;
  std::string_view sfen;
};

constexpr std::array<HandicapInfo, 8> HANDICAPS = {{
  {Handicap::HumSenteSikenbisha, "hum-sente-sikenbisha", "startpos"},
  {Handicap::HumSenteNakabisha, "hum-sente-nakabisha", "startpos"},
  {Handicap::HumHishaochi, "hum-hishaochi", "sfen lnsgkgsnl/1r5b1/ppppppppp/9/9/9/PPPPPPPPP/1B7/LNSGKGSNL b - 1"},
  {Handicap::HumNimaiochi, "hum-nimaiochi", "sfen lnsgkgsnl/1r5b1/ppppppppp/9/9/9/PPPPPPPPP/9/LNSGKGSNL b - 1"},
  {Handicap::ComSenteSikenbisha, "com-sente-sikenbisha",
   "sfen lnsgkgsnl/1r5b1/ppppppppp/9/9/9/PPPPPPPPP/1B5R1/LNSGKGSNL w - 1"},
  {Handicap::ComSenteNakabisha, "com-sente-nakabisha",
   "sfen lnsgkgsnl/1r5b1/ppppppppp/9/9/9/PPPPPPPPP/1B5R1/LNSGKGSNL w - 1"},
  {Handicap::ComHishaochi, "com-hishaochi", "sfen lnsgkgsnl/7b1/ppppppppp/9/9/9/PPPPPPPPP/1B5R1/LNSGKGSNL w - 1"},
  {Handicap::ComNimaiochi, "com-nimaiochi", "sfen lnsgkgsnl/9/ppppppppp/9/9/9/PPPPPPPPP/1B5R1/LNSGKGSNL w - 1"},
}};

const HandicapInfo& info(Handicap h) {
  return HANDICAPS[static_cast<std::size_t>(h)];
}

bool startsWith(Handicap h, Side sideToMove, const Board& board, const Hands& hands) {
  const SfenGame g = handicapStart(h);
  return g.sideToMove == sideToMove && g.board == board && g.hands == hands;
}

} // namespace

std::string_view handicapName(Handicap h) {
  return info(h).name;
}

std::optional<Handicap> parseHandicap(std::string_view name) {
  for (const auto& hi : HANDICAPS) {
    if (hi.name == name) return hi.handicap;
  }
  return std::nullopt;
}

SfenGame handicapStart(Handicap h) {
  return decodeSfen(info(h).sfen);
}

std::optional<Handicap> handicapFromStart(Side sideToMove, const Board& board, const Hands& hands, bool timelimit) {
  if (startsWith(Handicap::HumSenteSikenbisha, sideToMove, board, hands)) {
    return timelimit ? Handicap::HumSenteNakabisha : Handicap::HumSenteSikenbisha;
  }
  if (startsWith(Handicap::ComSenteSikenbisha, sideToMove, board, hands)) {
    return timelimit ? Handicap::ComSenteNakabisha : Handicap::ComSenteSikenbisha;
  }
  for (Handicap h : {Handicap::HumHishaochi, Handicap::HumNimaiochi, Handicap::ComHishaochi, Handicap::ComNimaiochi}) {
    if (startsWith(h, sideToMove, board, hands)) return h;
  }
  return std::nullopt;
}

} // namespace naitou
