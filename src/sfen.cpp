#include "naitou/sfen.hpp"

#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace naitou {

namespace {

[[noreturn]] void fail(const std::string& what) {
  throw std::runtime_error("Invalid SFEN: " + what);
}

constexpr std::string_view PIECE_LETTERS = "?PLNSBRGK"; // indexed by raw kind

std::optional<std::pair<Side, PieceKind>> pieceFromLetter(char ch) {
  const bool lower = (ch >= 'a' && ch <= 'z');
  const char up = lower ? static_cast<char>(ch - 'a' + 'A') : ch;
  const auto k = PIECE_LETTERS.find(up);
  if (k == std::string_view::npos || k == 0) return std::nullopt;
  return std::make_pair(lower ? COM : HUM, static_cast<PieceKind>(k));
}

char letterOf(Piece pc) {
  const PieceKind k = pieceKind(pc);
  const char up = PIECE_LETTERS[isPromoted(k) ? (k & 7) : k];
  return (pieceSide(pc) == COM) ? static_cast<char>(up - 'A' + 'a') : up;
}

Board decodeBoard(const std::string& s) {
  Board board{};
  int r = 0;
  int c = N - 1;
  bool promo = false;

  for (const char ch : s) {
    if (ch == '/') {
      if (promo || c != -1) fail("board row must have exactly 9 columns");
      if (++r >= N) fail("board must have exactly 9 rows");
      c = N - 1;
      continue;
    }
    if (ch == '+') {
      if (promo) fail("double '+'");
      if (c < 0) fail("row overflow");
      promo = true;
      continue;
    }
    if (ch >= '1' && ch <= '9') {
      if (promo) fail("'+' before digit");
      c -= ch - '0';
      if (c < -1) fail("row overflow");
      continue;
    }

    auto p = pieceFromLetter(ch);
    if (!p) fail(std::string("bad board piece '") + ch + "'");
    if (c < 0) fail("row overflow");
    PieceKind k = p->second;
    if (promo) {
      if (!isPromotable(k)) fail(std::string("piece cannot promote '") + ch + "'");
      k = promoted(k);
      promo = false;
    }
    board[sq(c, r)] = makePiece(p->first, k);
    --c;
  }

  if (promo || c != -1 || r != N - 1) fail("board must have exactly 9 rows of 9 columns");
  return board;
}

Hands decodeHands(const std::string& s) {
  Hands hands{};
  if (s == "-") return hands;

  int count = 0;
  for (const char ch : s) {
    if (ch >= '0' && ch <= '9') {
      if (ch == '0' && count == 0) fail("leading zero in hand count");
      count = count * 10 + (ch - '0');
      if (count > 255) fail("hand count too large");
      continue;
    }
    auto p = pieceFromLetter(ch);
    if (!p || p->second == KING) fail(std::string("bad hand piece '") + ch + "'");
    const int n = hands[p->first][p->second] + ((count == 0) ? 1 : count);
    if (n > 255) fail("hand count too large");
    hands[p->first][p->second] = static_cast<std::uint8_t>(n);
    count = 0;
  }
  if (count != 0) fail("dangling hand count");
  return hands;
}

} // namespace

SfenGame decodeSfen(std::string_view text) {
  std::istringstream iss{std::string(text)};
  std::vector<std::string> tokens;
  for (std::string tok; iss >> tok;) tokens.push_back(tok);

  std::size_t i = 0;
  if (i < tokens.size() && tokens[i] == "position") ++i;
  if (i >= tokens.size()) fail("empty position string");

  SfenGame g;
  if (tokens[i] == "startpos") {
    g.board = evenBoard();
    ++i;
  } else if (tokens[i] == "sfen") {
    if (i + 4 >= tokens.size()) fail("expected sfen <board> <side> <hands> <ply>");
    g.board = decodeBoard(tokens[i + 1]);

    if (tokens[i + 2] == "b") g.sideToMove = HUM;
    else if (tokens[i + 2] == "w") g.sideToMove = COM;
    else fail("bad side '" + tokens[i + 2] + "'");

    g.hands = decodeHands(tokens[i + 3]);

    const std::string& ply = tokens[i + 4];
    if (ply.empty() || ply[0] < '1' || ply[0] > '9' || ply.find_first_not_of("0123456789") != std::string::npos) {
      fail("bad ply '" + ply + "'");
    }
    i += 5;
  } else {
    fail("expected 'startpos' or 'sfen', got '" + tokens[i] + "'");
  }

  if (i < tokens.size()) {
    if (tokens[i] != "moves") fail("expected 'moves', got '" + tokens[i] + "'");
    for (++i; i < tokens.size(); ++i) {
      auto m = parseMoveToken(tokens[i]);
      if (!m) fail("bad move '" + tokens[i] + "'");
      g.moves.push_back(*m);
    }
  }
  return g;
}

std::string encodeSfenPosition(Side sideToMove, const Board& board, const Hands& hands) {
  const bool emptyHands = hands == Hands{};
  if (sideToMove == HUM && board == evenBoard() && emptyHands) return "startpos";

  std::ostringstream oss;
  oss << "sfen ";
  for (int r = 0; r < N; ++r) {
    int blanks = 0;
    for (int c = N - 1; c >= 0; --c) {
      const Piece pc = board[sq(c, r)];
      if (pc == NO_PIECE) {
        ++blanks;
        continue;
      }
      if (blanks) {
        oss << blanks;
        blanks = 0;
      }
      if (isPromoted(pieceKind(pc))) oss << '+';
      oss << letterOf(pc);
    }
    if (blanks) oss << blanks;
    if (r != N - 1) oss << '/';
  }

  oss << ' ' << ((sideToMove == HUM) ? 'b' : 'w') << ' ';

  if (emptyHands) {
    oss << '-';
  } else {
    for (Side s : {HUM, COM}) {
      for (PieceKind k : HAND_KINDS) {
        const int n = hands[s][k];
        if (n == 0) continue;
        if (n > 1) oss << n;
        oss << letterOf(makePiece(s, k));
      }
    }
  }
  oss << " 1";
  return oss.str();
}

std::string encodeSfen(Side sideToMove, const Board& board, const Hands& hands, const std::vector<Move>& moves) {
  std::string s = encodeSfenPosition(sideToMove, board, hands);
  s += " moves";
  for (const Move& m : moves) {
    s.push_back(' ');
    s += moveToString(m);
  }
  return s;
}

} // namespace naitou
