#pragma once
#include <array>
#include <cstdint>
#include "chessplanes/types.hpp"


namespace chessplanes {


struct Castling { // bit 0..3 = KQkq
unsigned rights = 0; // K=1, Q=2, k=4, q=8

static constexpr unsigned bit(Color c, CastleSide side) {
  return 1u << (static_cast<unsigned>(c) * 2u + static_cast<unsigned>(side));
}
bool has(Color c, CastleSide side) const { return (rights & bit(c, side)) != 0; }
void set(Color c, CastleSide side, bool on) {
  if (on) rights |= bit(c, side);
  else rights &= ~bit(c, side);
}
};


// Plain position record: piece placement plus the game-state fields an
// encoder reads. No move generation, no legality.
class Board {
public:
Board();
void clear();


void set_piece(Color c, Piece p, Square s);
void remove_piece(Color c, Piece p, Square s);

// Returns Piece::None for an empty square; c_out (if given) receives the color.
Piece piece_at(Square s, Color* c_out = nullptr) const;
int piece_count() const;


void set_side_to_move(Color c) { stm_ = c; }
Color side_to_move() const { return stm_; }


void set_castling(Castling c) { castling_ = c; }
Castling castling() const { return castling_; }


void set_ep_square(Square s) { ep_square_ = s; }
Square ep_square() const { return ep_square_; }


void set_halfmove_clock(int n) { halfmove_ = n; }
int halfmove_clock() const { return halfmove_; }


void set_fullmove_number(int n) { fullmove_ = n; }
int fullmove_number() const { return fullmove_; }


// Same piece on every square; game-state fields are not compared.
bool same_placement(const Board& o) const { return bb_ == o.bb_; }


private:
// bitboards[color][piece]
std::array<std::array<U64, PIECE_N>, COLOR_N> bb_{};
Color stm_ = Color::White;
Castling castling_{};
Square ep_square_ = NO_SQUARE;
int halfmove_ = 0;
int fullmove_ = 1;
};


} // namespace chessplanes
