#include "chessplanes/board.hpp"


namespace chessplanes {


Board::Board() { clear(); }


void Board::clear() {
for (auto& by_color : bb_) for (auto& b : by_color) b = 0ULL;
stm_ = Color::White;
castling_ = {};
ep_square_ = NO_SQUARE;
halfmove_ = 0;
fullmove_ = 1;
}


// A square holds at most one piece: placing over an occupied square replaces it.
void Board::set_piece(Color c, Piece p, Square s) {
const U64 mask = 1ULL << s;
for (auto& by_color : bb_) for (auto& b : by_color) b &= ~mask;
bb_[static_cast<std::size_t>(c)][static_cast<std::size_t>(p)] |= mask;
}


void Board::remove_piece(Color c, Piece p, Square s) {
bb_[static_cast<std::size_t>(c)][static_cast<std::size_t>(p)] &= ~(1ULL << s);
}


Piece Board::piece_at(Square s, Color* c_out) const {
  for (int c = 0; c < COLOR_N; ++c) {
    for (int p = 0; p < PIECE_N; ++p) {
      if ((bb_[static_cast<std::size_t>(c)][static_cast<std::size_t>(p)] >> s) & 1ULL) {
        if (c_out) *c_out = static_cast<Color>(c);
        return static_cast<Piece>(p);
      }
    }
  }
  return Piece::None;
}


int Board::piece_count() const {
int n = 0;
for (const auto& by_color : bb_)
for (U64 b : by_color) n += __builtin_popcountll(b);
return n;
}


} // namespace chessplanes
