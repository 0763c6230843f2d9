#include <cassert>
#include <string>

#include "chessplanes/board.hpp"
#include "chessplanes/decode.hpp"
#include "chessplanes/encode.hpp"
#include "chessplanes/fen.hpp"

using namespace chessplanes;

static const char* kFens[] = {
  STARTPOS_FEN,
  "8/8/8/8/8/8/8/8 w - - 0 1",
  "r1bqk2r/pppp1ppp/2n2n2/2b1p3/2B1P3/5N2/PPPP1PPP/RNBQK2R w KQkq - 4 4",
  "8/2k5/3p4/p2P1p2/P2P1P2/8/8/4K3 b - - 12 50",
  "rnbq1bnr/ppppkppp/8/4p3/4P3/8/PPPPKPPP/RNBQ1BNR w - - 2 3",
  "QQQQQQQQ/pppppppp/8/8/8/8/nnnnnnnn/kkkkkkkk w - - 0 1",
};

int main() {
  // --- decode(encode_basic(p)) reproduces placement ---
  for (const char* fen : kFens) {
    const Board b = board_from_fen(fen);
    const Board back = decode(encode_basic(b));
    assert(back.same_placement(b));
    for (Square s = 0; s < 64; ++s) {
      Color c1 = Color::White, c2 = Color::White;
      const Piece p1 = b.piece_at(s, &c1);
      const Piece p2 = back.piece_at(s, &c2);
      assert(p1 == p2);
      if (p1 != Piece::None) assert(c1 == c2);
    }
    // Strict mode accepts exact encodings.
    DecodeOptions strict;
    strict.strict = true;
    assert(decode(encode_basic(b), strict).same_placement(b));
  }

  // --- Game-state channels are ignored ---
  {
    const Board b = board_from_fen("rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b Kq e3 33 1");
    const Board back = decode(encode_extended(b));
    assert(back.same_placement(b));
    assert(back.side_to_move() == Color::White);
    assert(back.castling().rights == 0);
    assert(back.ep_square() == NO_SQUARE);
    assert(back.halfmove_clock() == 0);
    assert(back.fullmove_number() == 1);
  }

  // --- Threshold: > 0.5 is a piece, 0.5 itself is not ---
  {
    PlaneTensor x(12);
    x.at(3, 0, 0) = 0.93f;  // R a1
    x.at(9, 7, 7) = 0.51f;  // r h8
    x.at(0, 1, 1) = 0.5f;   // below threshold
    x.at(6, 6, 6) = 0.07f;
    const Board b = decode(x);
    assert(b.piece_count() == 2);
    Color c = Color::Black;
    assert(b.piece_at(make_square(0, 0), &c) == Piece::Rook && c == Color::White);
    assert(b.piece_at(make_square(7, 7), &c) == Piece::Rook && c == Color::Black);
  }

  // --- Multi-hot cell: lenient keeps the highest channel, strict rejects ---
  {
    PlaneTensor x(12);
    x.at(0, 3, 4) = 1.0f;  // P e4
    x.at(10, 3, 4) = 1.0f; // q e4
    Color c = Color::White;
    assert(decode(x).piece_at(make_square(4, 3), &c) == Piece::Queen && c == Color::Black);

    DecodeOptions strict;
    strict.strict = true;
    bool threw = false;
    try { (void)decode(x, strict); } catch (const DecodeError& e) {
      threw = std::string(e.what()).find("e4") != std::string::npos;
    }
    assert(threw);
  }

  // --- Strict mode rejects values far from 0 and 1 ---
  {
    PlaneTensor x(12);
    x.at(2, 2, 2) = 0.7f;
    DecodeOptions strict;
    strict.strict = true;
    bool threw = false;
    try { (void)decode(x, strict); } catch (const DecodeError&) { threw = true; }
    assert(threw);

    strict.tolerance = 0.35f;
    assert(decode(x, strict).piece_at(make_square(2, 2)) == Piece::Bishop);
  }

  // --- Invalid shapes ---
  {
    const PlaneTensor bad[] = { PlaneTensor(11), PlaneTensor(13), PlaneTensor(18), PlaneTensor(20),
                                PlaneTensor(12, 8, 9), PlaneTensor(19, 7, 8), PlaneTensor() };
    for (const auto& x : bad) {
      bool threw = false;
      try { (void)decode(x); } catch (const InvalidShape&) { threw = true; }
      assert(threw);
    }
  }

  return 0;
}
