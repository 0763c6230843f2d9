#include "chessplanes/uci.hpp"
#include "chessplanes/board.hpp"
#include "chessplanes/move.hpp"
#include "chessplanes/move_do.hpp"

#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace chessplanes {

static inline char file_char(int s) { return char('a' + file_of(s)); }
static inline char rank_char(int s) { return char('1' + rank_of(s)); }

static inline Piece promo_from_char(char c) {
  switch (std::tolower(static_cast<unsigned char>(c))) {
    case 'q': return Piece::Queen;
    case 'r': return Piece::Rook;
    case 'b': return Piece::Bishop;
    case 'n': return Piece::Knight;
    default:  return Piece::None;
  }
}

static inline char promo_to_char(Piece p) {
  switch (p) {
    case Piece::Queen:  return 'q';
    case Piece::Rook:   return 'r';
    case Piece::Bishop: return 'b';
    case Piece::Knight: return 'n';
    default:            return '\0';
  }
}

std::string move_to_uci(const Move& m) {
  std::string s;
  s.reserve(5);
  s.push_back(file_char(m.from));
  s.push_back(rank_char(m.from));
  s.push_back(file_char(m.to));
  s.push_back(rank_char(m.to));
  char pc = promo_to_char(m.promo);
  if (pc) s.push_back(pc);
  return s;
}

static inline Square sq_from_uci(std::string_view u, std::size_t idx) {
  const char f = u[idx];
  const char r = u[idx + 1];
  if (f < 'a' || f > 'h' || r < '1' || r > '8')
    throw std::invalid_argument("bad square in uci move: " + std::string(u));
  return make_square(f - 'a', r - '1');
}

Move uci_to_move(const Board& b, std::string_view uci) {
  if (uci.size() != 4 && uci.size() != 5)
    throw std::invalid_argument("bad uci length: " + std::string(uci));

  Move m;
  m.from = sq_from_uci(uci, 0);
  m.to   = sq_from_uci(uci, 2);
  if (uci.size() == 5) {
    m.promo = promo_from_char(uci[4]);
    if (m.promo == Piece::None)
      throw std::invalid_argument("bad promotion piece in uci move: " + std::string(uci));
  }

  Color us = Color::White;
  const Piece moving = b.piece_at(m.from, &us);
  if (moving == Piece::None)
    throw std::invalid_argument("uci move from empty square: " + std::string(uci));
  if (us != b.side_to_move())
    throw std::invalid_argument("uci move by the side not to move: " + std::string(uci));

  const int df = file_of(m.to) - file_of(m.from);
  if (moving == Piece::King && std::abs(df) == 2 && rank_of(m.to) == rank_of(m.from)) {
    m.flags = MoveFlag::Castle;
  } else if (moving == Piece::Pawn && std::abs(m.to - m.from) == 16) {
    m.flags = MoveFlag::DoublePush;
  } else if (moving == Piece::Pawn && df != 0 && m.to == b.ep_square() &&
             b.piece_at(m.to) == Piece::None) {
    m.flags = MoveFlag::EnPassant;
  } else if (b.piece_at(m.to) != Piece::None) {
    m.flags = MoveFlag::Capture;
  }
  return m;
}

void apply_uci_moves(Board& b, const std::vector<std::string>& moves) {
  Board work = b;
  for (const auto& u : moves) do_move(work, uci_to_move(work, u));
  b = work;
}

} // namespace chessplanes
