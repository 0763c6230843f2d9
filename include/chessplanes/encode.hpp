#pragma once

#include "chessplanes/board.hpp"
#include "chessplanes/planes.hpp"

namespace chessplanes {

// (12, 8, 8): one 1.0 per occupied square in the piece's channel.
PlaneTensor encode_basic(const Board& b);

// (19, 8, 8): encode_basic plus side to move, castling rights, en-passant
// file and the clamped halfmove clock (see PlaneLayout).
PlaneTensor encode_extended(const Board& b);

} // namespace chessplanes
