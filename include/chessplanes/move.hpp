#pragma once
#include <cstdint>
#include "chessplanes/types.hpp"


namespace chessplanes {


enum class MoveFlag : uint8_t {
Quiet = 0,
Capture = 1 << 0,
DoublePush = 1 << 1,
EnPassant = 1 << 2,
Castle = 1 << 3,
};


struct Move {
Square from{0};
Square to{0};
MoveFlag flags{MoveFlag::Quiet};
Piece promo{Piece::None};
};


} // namespace chessplanes
