#include "naitou/move.hpp"

#include <cctype>

namespace naitou {

namespace {

constexpr std::string_view DROP_LETTERS = "?PLNSBRG"; // indexed by raw kind

std::string sfenSquare(std::uint8_t s) {
  return std::string{static_cast<char>('1' + col(s)), static_cast<char>('a' + row(s))};
}

std::optional<std::uint8_t> parseSfenSquare(char f, char r) {
  if (f < '1' || f > '9' || r < 'a' || r > 'i') return std::nullopt;
  return sq(f - '1', r - 'a');
}

} // namespace

std::string squareToString(std::uint8_t s) {
  if (s == SQ_NONE) return "--";
  return std::string{static_cast<char>('1' + col(s)), static_cast<char>('1' + row(s))};
}

std::optional<std::uint8_t> parseSquare(std::string_view sv) {
  if (sv.size() != 2) return std::nullopt;
  if (sv[0] < '1' || sv[0] > '9' || sv[1] < '1' || sv[1] > '9') return std::nullopt;
  return sqAt(sv[0] - '0', sv[1] - '0');
}

std::string moveToString(const Move& m) {
  if (m.isNull()) return "none";
  if (m.drop) return std::string{DROP_LETTERS[m.dropKind()], '*'} + sfenSquare(m.dst);
  std::string s = sfenSquare(m.src) + sfenSquare(m.dst);
  if (m.promo) s.push_back('+');
  return s;
}

std::optional<Move> parseMoveToken(std::string_view tok) {
  if (tok.size() == 4 && tok[1] == '*') {
    const auto k = DROP_LETTERS.find(tok[0]);
    if (k == std::string_view::npos || k == 0) return std::nullopt;
    const auto dst = parseSfenSquare(tok[2], tok[3]);
    if (!dst) return std::nullopt;
    return Move::dropOf(static_cast<PieceKind>(k), *dst);
  }

  if (tok.size() != 4 && tok.size() != 5) return std::nullopt;
  if (tok.size() == 5 && tok[4] != '+') return std::nullopt;
  const auto src = parseSfenSquare(tok[0], tok[1]);
  const auto dst = parseSfenSquare(tok[2], tok[3]);
  if (!src || !dst || *src == *dst) return std::nullopt;
  return Move::walk(*src, *dst, tok.size() == 5);
}

} // namespace naitou
