#include "chessplanes/visualize.hpp"

#include <ostream>
#include <sstream>
#include <stdexcept>

namespace chessplanes {
namespace {

constexpr char kPieceSymbols[PlaneLayout::kPiecePlanes + 1] = "PNBRQKpnbrqk";
constexpr const char* kFooter = "  a b c d e f g h";

template <class CellFn>
void render_grid(std::ostream& out, CellFn cell) {
  for (int r = PlaneLayout::kRanks - 1; r >= 0; --r) {
    out << (r + 1) << ' ';
    for (int f = 0; f < PlaneLayout::kFiles; ++f) out << cell(r, f) << ' ';
    out << '\n';
  }
  out << kFooter << '\n';
}

} // namespace

void render(std::ostream& out, const PlaneTensor& x) {
  require_valid_shape(x, "render");
  out << "Combined view:\n";
  render_grid(out, [&](int r, int f) {
    for (int ch = 0; ch < PlaneLayout::kPiecePlanes; ++ch) {
      if (x.at(ch, r, f) > PlaneLayout::kActiveThreshold) return kPieceSymbols[ch];
    }
    return '.';
  });
}

void render_channel(std::ostream& out, const PlaneTensor& x, int channel) {
  require_valid_shape(x, "render_channel");
  if (channel < 0 || channel >= x.channels()) {
    throw std::out_of_range("render_channel: channel " + std::to_string(channel) +
                            " outside tensor " + shape_string(x));
  }
  out << "Channel " << channel << ":\n";
  render_grid(out, [&](int r, int f) {
    return x.at(channel, r, f) > PlaneLayout::kActiveThreshold ? '1' : '.';
  });
}

std::string to_string(const PlaneTensor& x) {
  std::ostringstream oss;
  render(oss, x);
  return oss.str();
}

std::string channel_to_string(const PlaneTensor& x, int channel) {
  std::ostringstream oss;
  render_channel(oss, x, channel);
  return oss.str();
}

} // namespace chessplanes
