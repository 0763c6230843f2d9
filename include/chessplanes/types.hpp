#pragma once
#include <cstdint>


namespace chessplanes {


using U64 = std::uint64_t;
using Square = int; // 0..63, a1 = 0, h8 = 63


enum class Color : int { White = 0, Black = 1 };


enum class Piece : int { Pawn=0, Knight=1, Bishop=2, Rook=3, Queen=4, King=5, None=6 };


enum class CastleSide : int { King = 0, Queen = 1 };


constexpr int COLOR_N = 2;
constexpr int PIECE_N = 6; // without None
constexpr int SQUARE_N = 64;
constexpr Square NO_SQUARE = -1;


inline constexpr int file_of(Square s) { return s & 7; }
inline constexpr int rank_of(Square s) { return s >> 3; }
inline constexpr Square make_square(int file, int rank) { return rank * 8 + file; }
inline constexpr Color other(Color c) { return c == Color::White ? Color::Black : Color::White; }


} // namespace chessplanes
