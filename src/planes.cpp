#include "chessplanes/planes.hpp"

#include <algorithm>
#include <numeric>

namespace chessplanes {
namespace {

constexpr std::array<ChannelPiece, PlaneLayout::kPiecePlanes> kChannelPieces = {{
  {Piece::Pawn,   Color::White},
  {Piece::Knight, Color::White},
  {Piece::Bishop, Color::White},
  {Piece::Rook,   Color::White},
  {Piece::Queen,  Color::White},
  {Piece::King,   Color::White},
  {Piece::Pawn,   Color::Black},
  {Piece::Knight, Color::Black},
  {Piece::Bishop, Color::Black},
  {Piece::Rook,   Color::Black},
  {Piece::Queen,  Color::Black},
  {Piece::King,   Color::Black},
}};

} // namespace

PlaneTensor::PlaneTensor(int channels, int ranks, int files)
  : channels_(channels), ranks_(ranks), files_(files) {
  if (channels <= 0 || ranks <= 0 || files <= 0) {
    throw InvalidShape("plane tensor dimensions must be positive, got (" +
                       std::to_string(channels) + "," + std::to_string(ranks) + "," +
                       std::to_string(files) + ")");
  }
  data_.assign(static_cast<std::size_t>(channels) * static_cast<std::size_t>(ranks) *
               static_cast<std::size_t>(files), 0.0f);
}

PlaneTensor PlaneTensor::from_values(std::span<const float> values, int channels, int ranks, int files) {
  PlaneTensor t(channels, ranks, files);
  if (values.size() != t.size()) {
    throw InvalidShape("expected " + std::to_string(t.size()) + " values for shape " +
                       shape_string(t) + ", got " + std::to_string(values.size()));
  }
  std::copy(values.begin(), values.end(), t.data_.begin());
  return t;
}

std::span<float> PlaneTensor::plane(int channel) {
  const std::size_t n = static_cast<std::size_t>(ranks_) * static_cast<std::size_t>(files_);
  return {data_.data() + static_cast<std::size_t>(channel) * n, n};
}

std::span<const float> PlaneTensor::plane(int channel) const {
  const std::size_t n = static_cast<std::size_t>(ranks_) * static_cast<std::size_t>(files_);
  return {data_.data() + static_cast<std::size_t>(channel) * n, n};
}

void PlaneTensor::fill_plane(int channel, float value) {
  for (float& v : plane(channel)) v = value;
}

float PlaneTensor::sum() const {
  return std::accumulate(data_.begin(), data_.end(), 0.0f);
}

float PlaneTensor::plane_sum(int channel) const {
  const auto p = plane(channel);
  return std::accumulate(p.begin(), p.end(), 0.0f);
}

int piece_channel(Piece p, Color c) {
  const int colorOffset = (c == Color::White) ? 0 : PlaneLayout::kBlackOffset;
  return colorOffset + static_cast<int>(p);
}

ChannelPiece channel_piece(int channel) {
  if (channel < 0 || channel >= PlaneLayout::kPiecePlanes) return {};
  return kChannelPieces[static_cast<std::size_t>(channel)];
}

bool has_valid_shape(const PlaneTensor& t) {
  if (t.ranks() != PlaneLayout::kRanks || t.files() != PlaneLayout::kFiles) return false;
  return t.channels() == PlaneLayout::kBasicChannels ||
         t.channels() == PlaneLayout::kExtendedChannels;
}

void require_valid_shape(const PlaneTensor& t, const char* what) {
  if (!has_valid_shape(t)) {
    throw InvalidShape(std::string(what) + ": expected (12,8,8) or (19,8,8), got " + shape_string(t));
  }
}

std::string shape_string(const PlaneTensor& t) {
  return "(" + std::to_string(t.channels()) + "," + std::to_string(t.ranks()) + "," +
         std::to_string(t.files()) + ")";
}

} // namespace chessplanes
