#include <cassert>
#include <string>
#include <type_traits>

#include "chessplanes/board.hpp"
#include "chessplanes/encode.hpp"
#include "chessplanes/fen.hpp"
#include "chessplanes/uci.hpp"

using namespace chessplanes;

static int file_column_sum(const PlaneTensor& x, int ch, int file) {
  int n = 0;
  for (int r = 0; r < 8; ++r) n += static_cast<int>(x.at(ch, r, file));
  return n;
}

// Every cell of the piece planes is 0 or 1, with at most one 1 per square.
static void check_one_hot(const PlaneTensor& x) {
  for (int r = 0; r < 8; ++r) {
    for (int f = 0; f < 8; ++f) {
      int ones = 0;
      for (int ch = 0; ch < PlaneLayout::kPiecePlanes; ++ch) {
        const float v = x.at(ch, r, f);
        if (v == 1.0f) ++ones;
        else assert(v == 0.0f);
      }
      assert(ones <= 1);
    }
  }
}

int main() {
  static_assert(std::is_same_v<decltype(PlaneTensor{}.data()), float*>);

  // --- Startpos, basic ---
  {
    const Board b = board_from_fen(STARTPOS_FEN);
    const PlaneTensor x = encode_basic(b);
    assert(x.channels() == 12 && x.ranks() == 8 && x.files() == 8);
    assert(x.size() == 12u * 64u);
    check_one_hot(x);
    assert(x.sum() == 32.0f);

    // White pawns on rank index 1, Black pawns on rank index 6.
    for (int f = 0; f < 8; ++f) {
      assert(x.at(0, 1, f) == 1.0f);
      assert(x.at(6, 6, f) == 1.0f);
    }
    assert(x.plane_sum(0) == 8.0f);
    assert(x.plane_sum(6) == 8.0f);

    // White knights b1, g1; Black knights b8, g8.
    assert(x.at(1, 0, 1) == 1.0f && x.at(1, 0, 6) == 1.0f);
    assert(x.plane_sum(1) == 2.0f);
    assert(x.at(7, 7, 1) == 1.0f && x.at(7, 7, 6) == 1.0f);
    assert(x.plane_sum(7) == 2.0f);

    // Kings and queens.
    assert(x.at(4, 0, 3) == 1.0f); // Qd1
    assert(x.at(5, 0, 4) == 1.0f); // Ke1
    assert(x.at(10, 7, 3) == 1.0f); // qd8
    assert(x.at(11, 7, 4) == 1.0f); // ke8
  }

  // --- Empty board ---
  {
    const Board b;
    assert(encode_basic(b).sum() == 0.0f);
  }

  // --- Single piece: White queen on e4 ---
  {
    Board b;
    b.set_piece(Color::White, Piece::Queen, make_square(4, 3));
    const PlaneTensor x = encode_basic(b);
    assert(x.sum() == 1.0f);
    assert(x.at(4, 3, 4) == 1.0f);
  }

  // --- Encoding follows moves ---
  {
    Board b = board_from_fen(STARTPOS_FEN);
    apply_uci_moves(b, {"e2e4"});
    const PlaneTensor x = encode_basic(b);
    assert(x.at(0, 1, 4) == 0.0f);
    assert(x.at(0, 3, 4) == 1.0f);
    check_one_hot(x);
  }

  // --- Extended at startpos ---
  {
    const Board b = board_from_fen(STARTPOS_FEN);
    const PlaneTensor x = encode_extended(b);
    assert(x.channels() == 19);
    assert(x.size() == 19u * 64u);

    // Piece planes match the basic encoding.
    const PlaneTensor basic = encode_basic(b);
    for (int ch = 0; ch < 12; ++ch)
      for (int r = 0; r < 8; ++r)
        for (int f = 0; f < 8; ++f) assert(x.at(ch, r, f) == basic.at(ch, r, f));

    assert(x.plane_sum(PlaneLayout::kSideToMove) == 64.0f);
    assert(x.plane_sum(PlaneLayout::kWhiteKingside) == 64.0f);
    assert(x.plane_sum(PlaneLayout::kWhiteQueenside) == 64.0f);
    assert(x.plane_sum(PlaneLayout::kBlackKingside) == 64.0f);
    assert(x.plane_sum(PlaneLayout::kBlackQueenside) == 64.0f);
    assert(x.plane_sum(PlaneLayout::kEnPassant) == 0.0f);
    assert(x.plane_sum(PlaneLayout::kHalfmoveClock) == 0.0f);
  }

  // --- After 1. e4: Black to move, en-passant on the e-file ---
  {
    Board b = board_from_fen(STARTPOS_FEN);
    apply_uci_moves(b, {"e2e4"});
    const PlaneTensor x = encode_extended(b);
    assert(x.plane_sum(PlaneLayout::kSideToMove) == 0.0f);
    assert(x.plane_sum(PlaneLayout::kEnPassant) == 8.0f);
    for (int f = 0; f < 8; ++f) {
      assert(file_column_sum(x, PlaneLayout::kEnPassant, f) == (f == 4 ? 8 : 0));
    }
  }

  // --- Castling rights lost on one side only ---
  {
    const Board b = board_from_fen("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBN1 w Qkq - 0 1");
    const PlaneTensor x = encode_extended(b);
    assert(x.plane_sum(PlaneLayout::kWhiteKingside) == 0.0f);
    assert(x.plane_sum(PlaneLayout::kWhiteQueenside) == 64.0f);
    assert(x.plane_sum(PlaneLayout::kBlackKingside) == 64.0f);
    assert(x.plane_sum(PlaneLayout::kBlackQueenside) == 64.0f);
  }

  // --- Halfmove clock: scaled by 1/100 and clamped ---
  {
    const PlaneTensor half = encode_extended(board_from_fen("4k3/8/8/8/8/8/8/4K3 w - - 50 80"));
    for (float v : half.plane(PlaneLayout::kHalfmoveClock)) assert(v == 0.5f);

    const PlaneTensor full = encode_extended(board_from_fen("4k3/8/8/8/8/8/8/4K3 w - - 150 120"));
    for (float v : full.plane(PlaneLayout::kHalfmoveClock)) assert(v == 1.0f);
  }

  // --- Encoding does not touch the board ---
  {
    const Board b = board_from_fen("r3k2r/8/8/3pP3/8/8/8/R3K2R w KQkq d6 7 30");
    const std::string before = to_fen(b);
    (void)encode_extended(b);
    assert(to_fen(b) == before);
  }

  return 0;
}
