#include <cassert>
#include "chessplanes/board.hpp"


int main() {
using namespace chessplanes;
Board a;
assert(a.piece_count() == 0);
assert(a.piece_at(12) == Piece::None);
assert(a.side_to_move() == Color::White);
assert(a.ep_square() == NO_SQUARE);
assert(a.halfmove_clock() == 0 && a.fullmove_number() == 1);

a.set_piece(Color::White, Piece::Pawn, 12);
Color c = Color::White;
assert(a.piece_at(12, &c) == Piece::Pawn && c == Color::White);
assert(a.piece_count() == 1);

// Placing onto an occupied square replaces the occupant.
a.set_piece(Color::Black, Piece::Knight, 12);
assert(a.piece_at(12, &c) == Piece::Knight && c == Color::Black);
assert(a.piece_count() == 1);

a.remove_piece(Color::Black, Piece::Knight, 12);
assert(a.piece_at(12) == Piece::None);

Castling cr{};
cr.set(Color::Black, CastleSide::Queen, true);
assert(cr.rights == 0x8);
assert(cr.has(Color::Black, CastleSide::Queen));
assert(!cr.has(Color::White, CastleSide::Queen));
assert(Castling::bit(Color::White, CastleSide::King) == 0x1);
assert(Castling::bit(Color::White, CastleSide::Queen) == 0x2);
assert(Castling::bit(Color::Black, CastleSide::King) == 0x4);
return 0;
}
