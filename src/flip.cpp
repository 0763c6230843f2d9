#include "chessplanes/flip.hpp"

namespace chessplanes {
namespace {

void copy_mirrored(const PlaneTensor& src, int from, PlaneTensor& dst, int to) {
  for (int r = 0; r < PlaneLayout::kRanks; ++r) {
    const int mr = PlaneLayout::kRanks - 1 - r;
    for (int f = 0; f < PlaneLayout::kFiles; ++f) dst.at(to, mr, f) = src.at(from, r, f);
  }
}

void copy_plane(const PlaneTensor& src, int from, PlaneTensor& dst, int to) {
  const auto in = src.plane(from);
  auto out = dst.plane(to);
  for (std::size_t i = 0; i < in.size(); ++i) out[i] = in[i];
}

// Castling planes move between colors as flags, not as board squares.
constexpr int kCastlingSwap[][2] = {
  {PlaneLayout::kWhiteKingside,  PlaneLayout::kBlackKingside},
  {PlaneLayout::kWhiteQueenside, PlaneLayout::kBlackQueenside},
};

} // namespace

PlaneTensor flip(const PlaneTensor& x) {
  require_valid_shape(x, "flip");

  PlaneTensor y(x.channels());

  for (int i = 0; i < PlaneLayout::kBlackOffset; ++i) {
    copy_mirrored(x, i + PlaneLayout::kBlackOffset, y, i);
    copy_mirrored(x, i, y, i + PlaneLayout::kBlackOffset);
  }

  if (x.channels() == PlaneLayout::kBasicChannels) return y;

  {
    const auto in = x.plane(PlaneLayout::kSideToMove);
    auto out = y.plane(PlaneLayout::kSideToMove);
    for (std::size_t i = 0; i < in.size(); ++i) out[i] = 1.0f - in[i];
  }

  for (const auto& pair : kCastlingSwap) {
    copy_plane(x, pair[0], y, pair[1]);
    copy_plane(x, pair[1], y, pair[0]);
  }

  copy_mirrored(x, PlaneLayout::kEnPassant, y, PlaneLayout::kEnPassant);
  copy_plane(x, PlaneLayout::kHalfmoveClock, y, PlaneLayout::kHalfmoveClock);

  return y;
}

} // namespace chessplanes
