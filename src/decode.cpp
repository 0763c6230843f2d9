#include "chessplanes/decode.hpp"

#include <cmath>
#include <string>

namespace chessplanes {

static std::string square_name(int file, int rank) {
  std::string s;
  s += char('a' + file);
  s += char('1' + rank);
  return s;
}

static bool near_binary(float v, float tol) {
  return std::fabs(v) <= tol || std::fabs(v - 1.0f) <= tol;
}

static void check_cell(const PlaneTensor& x, int rank, int file, float tol) {
  int active = 0;
  for (int ch = 0; ch < PlaneLayout::kPiecePlanes; ++ch) {
    const float v = x.at(ch, rank, file);
    if (!near_binary(v, tol)) {
      throw DecodeError("decode: ambiguous value " + std::to_string(v) + " in channel " +
                        std::to_string(ch) + " at " + square_name(file, rank));
    }
    if (v > PlaneLayout::kActiveThreshold) ++active;
  }
  if (active > 1) {
    throw DecodeError("decode: " + std::to_string(active) + " piece channels active at " +
                      square_name(file, rank));
  }
}

Board decode(const PlaneTensor& x, const DecodeOptions& opt) {
  require_valid_shape(x, "decode");

  if (opt.strict) {
    for (int r = 0; r < PlaneLayout::kRanks; ++r)
      for (int f = 0; f < PlaneLayout::kFiles; ++f) check_cell(x, r, f, opt.tolerance);
  }

  Board b;
  for (int ch = 0; ch < PlaneLayout::kPiecePlanes; ++ch) {
    const ChannelPiece cp = channel_piece(ch);
    for (int r = 0; r < PlaneLayout::kRanks; ++r) {
      for (int f = 0; f < PlaneLayout::kFiles; ++f) {
        if (x.at(ch, r, f) > PlaneLayout::kActiveThreshold) {
          b.set_piece(cp.color, cp.piece, make_square(f, r));
        }
      }
    }
  }
  return b;
}

} // namespace chessplanes
