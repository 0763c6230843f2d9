#pragma once

#include <stdexcept>

#include "chessplanes/board.hpp"
#include "chessplanes/planes.hpp"

namespace chessplanes {

struct DecodeError : std::runtime_error { using std::runtime_error::runtime_error; };

struct DecodeOptions {
  // Reject cells with more than one active piece channel, and piece values
  // that are not within `tolerance` of 0 or 1.
  bool strict = false;
  float tolerance = 0.05f;
};

// Rebuilds piece placement from channels 0..11. A cell is occupied when its
// value exceeds 0.5. Game-state channels (12..18) are ignored: the result
// has White to move, no castling rights, no en-passant square and clocks 0/1.
//
// Lenient mode: when several channels are active on one cell the highest
// channel index wins.
//
// Throws InvalidShape for tensors that are not (12|19, 8, 8), and
// DecodeError in strict mode.
Board decode(const PlaneTensor& x, const DecodeOptions& opt = {});

} // namespace chessplanes
