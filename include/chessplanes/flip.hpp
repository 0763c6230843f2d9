#pragma once

#include "chessplanes/planes.hpp"

namespace chessplanes {

// Views the position from the other side: White and Black piece planes
// trade places and every board plane is mirrored along the rank axis.
// For 19-channel tensors the side-to-move plane becomes 1 - value, castling
// planes swap K<->k and Q<->q unmirrored, the en-passant plane is mirrored
// and the clock plane is copied.
//
// flip(flip(x)) == x exactly. Throws InvalidShape for tensors that are not
// (12|19, 8, 8).
PlaneTensor flip(const PlaneTensor& x);

} // namespace chessplanes
