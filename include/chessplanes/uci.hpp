// include/chessplanes/uci.hpp
#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace chessplanes {

struct Move;
class Board;

// Convert a Move to a UCI string like "e2e4" or "a7a8q"
std::string move_to_uci(const Move& m);

// Parse a UCI string against the given board. Castling, double pushes,
// en-passant and promotions are read off the board, not generated.
// Throws std::invalid_argument for malformed text, an empty source square or
// a piece of the side not to move.
Move uci_to_move(const Board& b, std::string_view uci);

// Parses and plays each move in order. All or nothing: if any move throws,
// b is left as it was.
void apply_uci_moves(Board& b, const std::vector<std::string>& moves);

} // namespace chessplanes
