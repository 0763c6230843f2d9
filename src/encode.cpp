#include "chessplanes/encode.hpp"

#include <algorithm>

#include "chessplanes/types.hpp"

namespace chessplanes {
namespace {

void encode_pieces(const Board& b, PlaneTensor& x) {
  for (Square s = 0; s < SQUARE_N; ++s) {
    Color c = Color::White;
    const Piece p = b.piece_at(s, &c);
    if (p == Piece::None) continue;
    x.at(piece_channel(p, c), rank_of(s), file_of(s)) = 1.0f;
  }
}

struct CastlingPlane {
  int channel;
  Color color;
  CastleSide side;
};

constexpr CastlingPlane kCastlingPlanes[] = {
  {PlaneLayout::kWhiteKingside,  Color::White, CastleSide::King},
  {PlaneLayout::kWhiteQueenside, Color::White, CastleSide::Queen},
  {PlaneLayout::kBlackKingside,  Color::Black, CastleSide::King},
  {PlaneLayout::kBlackQueenside, Color::Black, CastleSide::Queen},
};

} // namespace

PlaneTensor encode_basic(const Board& b) {
  PlaneTensor x(PlaneLayout::kBasicChannels);
  encode_pieces(b, x);
  return x;
}

PlaneTensor encode_extended(const Board& b) {
  PlaneTensor x(PlaneLayout::kExtendedChannels);
  encode_pieces(b, x);

  if (b.side_to_move() == Color::White) x.fill_plane(PlaneLayout::kSideToMove, 1.0f);

  const Castling cr = b.castling();
  for (const auto& cp : kCastlingPlanes) {
    if (cr.has(cp.color, cp.side)) x.fill_plane(cp.channel, 1.0f);
  }

  // Whole file column, every rank.
  const Square ep = b.ep_square();
  if (ep >= 0 && ep < SQUARE_N) {
    const int f = file_of(ep);
    for (int r = 0; r < PlaneLayout::kRanks; ++r) x.at(PlaneLayout::kEnPassant, r, f) = 1.0f;
  }

  const float clock = std::min(static_cast<float>(b.halfmove_clock()) / PlaneLayout::kHalfmoveScale, 1.0f);
  x.fill_plane(PlaneLayout::kHalfmoveClock, clock);

  return x;
}

} // namespace chessplanes
