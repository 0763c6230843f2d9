#include "chessplanes/move_do.hpp"
#include <stdexcept>

namespace chessplanes {

// Home squares of the rooks that carry each castling right.
static constexpr Square kRookHome[COLOR_N][2] = {
  {7, 0},   // h1 -> K, a1 -> Q
  {63, 56}, // h8 -> k, a8 -> q
};

static void clear_rook_right(Castling& cr, Color owner, Square sq) {
  const auto& home = kRookHome[static_cast<int>(owner)];
  if (sq == home[0]) cr.set(owner, CastleSide::King, false);
  if (sq == home[1]) cr.set(owner, CastleSide::Queen, false);
}

static Square castle_rook_from(const Move& m, Color us) {
  const auto& home = kRookHome[static_cast<int>(us)];
  return m.to > m.from ? home[0] : home[1];
}

static bool has_piece(const Board& b, Square s, Color c, Piece p) {
  Color sc = Color::White;
  return b.piece_at(s, &sc) == p && sc == c;
}

// Everything do_move relies on, checked before the board is touched.
static void validate_move(const Board& b, const Move& m, Color us) {
  if (m.from < 0 || m.from >= SQUARE_N || m.to < 0 || m.to >= SQUARE_N)
    throw std::invalid_argument("do_move: square out of range");

  if (m.flags == MoveFlag::Castle) {
    if (!has_piece(b, m.from, us, Piece::King))
      throw std::invalid_argument("do_move: castle without a king of the side to move");
    if (rank_of(m.from) != rank_of(m.to) || (m.to - m.from != 2 && m.from - m.to != 2))
      throw std::invalid_argument("do_move: castle must move the king two files");
    if (!has_piece(b, castle_rook_from(m, us), us, Piece::Rook))
      throw std::invalid_argument("do_move: castle without a rook on its home square");
    return;
  }

  Color sc = Color::White;
  if (b.piece_at(m.from, &sc) == Piece::None || sc != us)
    throw std::invalid_argument("do_move: no piece of the side to move on the source square");
  Color dc = Color::White;
  if (b.piece_at(m.to, &dc) != Piece::None && dc == us)
    throw std::invalid_argument("do_move: destination holds a piece of the side to move");
}

static void do_castle(Board& b, const Move& m, Color us) {
  const Square rook_from = castle_rook_from(m, us);
  const Square rook_to = m.to > m.from ? m.from + 1 : m.from - 1;

  b.remove_piece(us, Piece::King, m.from);
  b.set_piece(us, Piece::King, m.to);
  b.remove_piece(us, Piece::Rook, rook_from);
  b.set_piece(us, Piece::Rook, rook_to);

  b.set_halfmove_clock(b.halfmove_clock() + 1);
}

void do_move(Board& b, const Move& m) {
  const Color us = b.side_to_move();
  validate_move(b, m, us);

  const Square prev_ep = b.ep_square();
  Castling cr = b.castling();

  b.set_ep_square(NO_SQUARE);

  if (m.flags == MoveFlag::Castle) {
    do_castle(b, m, us);
    cr.set(us, CastleSide::King, false);
    cr.set(us, CastleSide::Queen, false);
  } else {
    const Piece srcP = b.piece_at(m.from);

    Color dc = Color::White;
    const Piece dstP = b.piece_at(m.to, &dc);

    bool captured = false;
    if (srcP == Piece::Pawn && dstP == Piece::None && m.to == prev_ep) {
      const Square cap_sq = m.to + (us == Color::White ? -8 : +8);
      b.remove_piece(other(us), Piece::Pawn, cap_sq);
      captured = true;
    } else if (dstP != Piece::None) {
      b.remove_piece(dc, dstP, m.to);
      if (dstP == Piece::Rook) clear_rook_right(cr, dc, m.to);
      captured = true;
    }

    b.remove_piece(us, srcP, m.from);
    b.set_piece(us, (m.promo != Piece::None ? m.promo : srcP), m.to);

    if (captured || srcP == Piece::Pawn) b.set_halfmove_clock(0);
    else b.set_halfmove_clock(b.halfmove_clock() + 1);

    if (srcP == Piece::Pawn && (m.to - m.from == 16 || m.from - m.to == 16))
      b.set_ep_square((m.from + m.to) / 2);

    if (srcP == Piece::King) {
      cr.set(us, CastleSide::King, false);
      cr.set(us, CastleSide::Queen, false);
    } else if (srcP == Piece::Rook) {
      clear_rook_right(cr, us, m.from);
    }
  }

  b.set_castling(cr);
  if (us == Color::Black) b.set_fullmove_number(b.fullmove_number() + 1);
  b.set_side_to_move(other(us));
}

} // namespace chessplanes
