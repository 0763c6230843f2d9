#pragma once
#include <string>
#include <string_view>
#include <stdexcept>
#include "chessplanes/board.hpp"

namespace chessplanes {

struct FenError : std::runtime_error { using std::runtime_error::runtime_error; };

inline constexpr char STARTPOS_FEN[] =
  "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

// Accepts 4 to 6 fields; missing clocks default to "0 1".
void set_from_fen(Board& b, std::string_view fen);
Board board_from_fen(std::string_view fen);

std::string to_fen(const Board& b);
// Only the first FEN field (piece placement).
std::string placement_fen(const Board& b);

char piece_to_char(Piece p, Color c);

} // namespace chessplanes
