#include <cassert>
#include <string>
#include "chessplanes/board.hpp"
#include "chessplanes/fen.hpp"


int main() {
using namespace chessplanes;


// Round-trip startpos
Board b1;
set_from_fen(b1, STARTPOS_FEN);
assert(to_fen(b1) == STARTPOS_FEN);
assert(b1.piece_count() == 32);
assert(placement_fen(b1) == "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR");


// Castling rights only on white, EP square, clocks
Board b2;
set_from_fen(b2, "rnbqkbnr/pppp1ppp/8/4p3/8/8/PPPPPPPP/R3K2R w K e6 3 7");
assert(to_fen(b2) == "rnbqkbnr/pppp1ppp/8/4p3/8/8/PPPPPPPP/R3K2R w K e6 3 7");
assert(b2.ep_square() == make_square(4, 5));
assert(b2.halfmove_clock() == 3 && b2.fullmove_number() == 7);


// Clocks may be omitted
const Board b3 = board_from_fen("8/8/8/8/8/8/8/8 b - -");
assert(b3.piece_count() == 0);
assert(b3.side_to_move() == Color::Black);
assert(to_fen(b3) == "8/8/8/8/8/8/8/8 b - - 0 1");


// Malformed input
const char* bad[] = {
  "",
  "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP w KQkq -",        // 7 ranks
  "rnbqkbnr/pppppppp/9/8/8/8/PPPPPPPP/RNBQKBNR w - -",  // rank overflow
  "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNX w - -",  // bad piece
  "8/8/8/8/8/8/8/8 x - -",                               // bad color
  "8/8/8/8/8/8/8/8 w KX -",                              // bad castling
  "8/8/8/8/8/8/8/8 w - e9",                              // bad ep
  "8/8/8/8/8/8/8/8 w - - -1 1",                          // negative clock
};
for (const char* fen : bad) {
  bool threw = false;
  try { Board b; set_from_fen(b, fen); } catch (const FenError&) { threw = true; }
  assert(threw);
}


return 0;
}
