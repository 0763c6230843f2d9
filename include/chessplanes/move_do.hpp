#pragma once
#include "chessplanes/move.hpp"
#include "chessplanes/board.hpp"

namespace chessplanes {

// Applies m to b, updating side to move, castling rights, en-passant square
// and both clocks. No legality check is made, but a move without a piece of
// the side to move on its source square (or, for a castle, without that
// side's king and rook on their squares) throws std::invalid_argument and
// leaves b unchanged.
void do_move(Board& b, const Move& m);

} // namespace chessplanes
