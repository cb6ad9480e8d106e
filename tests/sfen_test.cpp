#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "naitou/handicap.hpp"
#include "naitou/move.hpp"
#include "naitou/sfen.hpp"

using namespace naitou;

static bool rejects(const std::string& text) {
  try {
    (void)decodeSfen(text);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

static std::string roundTrip(const std::string& text) {
  const SfenGame g = decodeSfen(text);
  return encodeSfen(g.sideToMove, g.board, g.hands, g.moves);
}

int main() {
  // startpos and its move list
  {
    const SfenGame g = decodeSfen("position startpos moves 7g7f 3c3d 8h2b+ 3a2b B*4e");
    assert(g.sideToMove == HUM);
    assert(g.board == evenBoard());
    assert(g.hands == Hands{});
    assert(g.moves.size() == 5);
    assert(g.moves[0] == Move::walk(sqAt(7, 7), sqAt(7, 6)));
    assert(g.moves[2] == Move::walk(sqAt(8, 8), sqAt(2, 2), true));
    assert(g.moves[4] == Move::dropOf(BISHOP, sqAt(4, 5)));
    assert(g.position() == Position::even());
  }

  // Encoding keeps the canonical form
  {
    assert(roundTrip("startpos moves") == "startpos moves");
    assert(roundTrip("startpos moves 7g7f 3c3d") == "startpos moves 7g7f 3c3d");
    assert(roundTrip("startpos") == "startpos moves");
    assert(encodeSfenPosition(HUM, evenBoard(), Hands{}) == "startpos");
    assert(encodeSfenPosition(COM, evenBoard(), Hands{}) ==
           "sfen lnsgkgsnl/1r5b1/ppppppppp/9/9/9/PPPPPPPPP/1B5R1/LNSGKGSNL w - 1");

    const std::vector<std::string> samples = {
      "sfen lnsgkgsnl/1r5b1/ppppppppp/9/9/9/PPPPPPPPP/1B7/LNSGKGSNL b - 1 moves",
      "sfen lnsgkgsnl/9/ppppppppp/9/9/9/PPPPPPPPP/1B5R1/LNSGKGSNL w - 1 moves 5a4b 7g7f",
      "sfen R8/2K1S1SSk/4B4/9/9/9/9/9/1L1L1L3 b RBGSNLP3g3n17p 1 moves",
      "sfen 4k4/9/4+P4/9/9/9/9/9/4K4 b 2S10p 1 moves S*5b",
      "sfen lnsg1g1nl/1r2k2s1/pppp1pppp/9/9/9/PPPP1PPPP/1S2K2R1/LN1G1GSNL w BPbp 1 moves P*5e",
    };
    for (const std::string& s : samples) assert(roundTrip(s) == s);
  }

  // Hands decode counts and sides
  {
    const SfenGame g = decodeSfen("sfen R8/2K1S1SSk/4B4/9/9/9/9/9/1L1L1L3 b RBGSNLP3g3n17p 1");
    assert(g.hands[HUM][ROOK] == 1);
    assert(g.hands[HUM][PAWN] == 1);
    assert(g.hands[COM][GOLD] == 3);
    assert(g.hands[COM][KNIGHT] == 3);
    assert(g.hands[COM][PAWN] == 17);
    assert(g.board[sqAt(9, 1)] == makePiece(HUM, ROOK));
    assert(g.board[sqAt(1, 2)] == makePiece(COM, KING));
  }

  // Malformed input is rejected
  {
    assert(rejects(""));
    assert(rejects("position"));
    assert(rejects("startpos 7g7f"));
    assert(rejects("startpos moves 7g7"));
    assert(rejects("startpos moves 0g7f"));
    assert(rejects("sfen lnsgkgsnl/1r5b1/ppppppppp/9/9/9/PPPPPPPPP/1B5R1 b - 1"));
    assert(rejects("sfen lnsgkgsnl/1r5b1/ppppppppp/9/9/9/PPPPPPPPP/1B5R1/LNSGKGSNLL b - 1"));
    assert(rejects("sfen lnsgkgsnl/1r5b1/ppppppppp/9/9/9/PPPPPPPPP/1B5R1/LNSGKGSNL x - 1"));
    assert(rejects("sfen lnsgkgsnl/1r5b1/ppppppppp/9/9/9/PPPPPPPPP/1B5R1/LNSGKGSNL b K 1"));
    assert(rejects("sfen lnsgkgsnl/1r5b1/ppppppppp/9/9/9/PPPPPPPPP/1B5R1/LNSGKGSNL b - 0"));
    assert(rejects("sfen lnsgkgsnl/1r5b1/ppppppppp/9/9/9/PPPPPPPPP/1B5R1/+KNSGKGSNL b - 1"));
    assert(rejects("sfen lnsgkgsnl/1r5b1/ppppppppp/9/9/9/PPPPPPPPP/1B5R1/LNSGKGSNL b -"));
  }

  // Move tokens
  {
    assert(parseMoveToken("7g7f") == Move::walk(sqAt(7, 7), sqAt(7, 6)));
    assert(parseMoveToken("2b3a+") == Move::walk(sqAt(2, 2), sqAt(3, 1), true));
    assert(parseMoveToken("P*5e") == Move::dropOf(PAWN, sqAt(5, 5)));
    assert(!parseMoveToken("K*5e"));
    assert(!parseMoveToken("P*5e+"));
    assert(!parseMoveToken("7g7f7"));
    assert(!parseMoveToken("7j7f"));
    assert(moveToString(Move::dropOf(GOLD, sqAt(1, 9))) == "G*1i");
    assert(parseSquare("76") == sqAt(7, 6));
    assert(!parseSquare("70"));
    assert(squareToString(sqAt(2, 2)) == "22");
    assert(moveToString(Move::walk(sqAt(8, 8), sqAt(2, 2), true)) == "8h2b+");
  }

  // Handicap start positions
  {
    for (int i = 0; i < 8; ++i) {
      const auto h = static_cast<Handicap>(i);
      assert(parseHandicap(handicapName(h)) == h);
      const SfenGame g = handicapStart(h);
      assert(comMovesFirst(h) == (g.sideToMove == COM));
      assert(handicapFromStart(g.sideToMove, g.board, g.hands, h == Handicap::HumSenteNakabisha ||
                                                                 h == Handicap::ComSenteNakabisha) == h);
    }
    assert(!parseHandicap("hirate"));

    const SfenGame even = decodeSfen("startpos");
    assert(handicapFromStart(even.sideToMove, even.board, even.hands, false) == Handicap::HumSenteSikenbisha);
    assert(handicapFromStart(even.sideToMove, even.board, even.hands, true) == Handicap::HumSenteNakabisha);

    const SfenGame odd = decodeSfen("sfen 4k4/9/9/9/9/9/9/9/4K4 b - 1");
    assert(!handicapFromStart(odd.sideToMove, odd.board, odd.hands, false));
  }

  std::cout << "sfen_test passed\n";
  return 0;
}
