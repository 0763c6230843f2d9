#pragma once

#include <array>
#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "chessplanes/types.hpp"

namespace chessplanes {

struct InvalidShape : std::runtime_error { using std::runtime_error::runtime_error; };

// Channel layout of the (C, 8, 8) plane encoding. Axis order is
// (channel, rank, file); rank 0 is rank 1, file 0 is the a-file.
//
// - 0..11: piece planes [WP,WN,WB,WR,WQ,WK, BP,BN,BB,BR,BQ,BK]
// - 12:    side to move (all 1.0 when White moves)
// - 13..16: castling rights [K,Q,k,q] (all 1.0 when available)
// - 17:    en-passant file (1.0 on every rank of the target file)
// - 18:    halfmove clock / 100, clamped to 1.0
//
// The layout is a stable contract: stored datasets depend on it.
struct PlaneLayout {
  static constexpr int kRanks = 8;
  static constexpr int kFiles = 8;
  static constexpr int kPlaneSize = kRanks * kFiles; // 64

  static constexpr int kPiecePlanes = 12;
  static constexpr int kBlackOffset = 6;

  static constexpr int kSideToMove = 12;
  static constexpr int kWhiteKingside = 13;
  static constexpr int kWhiteQueenside = 14;
  static constexpr int kBlackKingside = 15;
  static constexpr int kBlackQueenside = 16;
  static constexpr int kEnPassant = 17;
  static constexpr int kHalfmoveClock = 18;

  static constexpr int kBasicChannels = 12;
  static constexpr int kExtendedChannels = 19;

  static constexpr float kHalfmoveScale = 100.0f;
  static constexpr float kActiveThreshold = 0.5f;
};

// Dense float32 (channels, ranks, files) array, row-major.
class PlaneTensor {
public:
  PlaneTensor() = default;
  // Zero-filled. Throws InvalidShape unless every dimension is positive.
  explicit PlaneTensor(int channels,
                       int ranks = PlaneLayout::kRanks,
                       int files = PlaneLayout::kFiles);

  // Copies values; throws InvalidShape if values.size() != channels*ranks*files.
  static PlaneTensor from_values(std::span<const float> values,
                                 int channels,
                                 int ranks = PlaneLayout::kRanks,
                                 int files = PlaneLayout::kFiles);

  int channels() const { return channels_; }
  int ranks() const { return ranks_; }
  int files() const { return files_; }
  std::size_t size() const { return data_.size(); }
  bool empty() const { return data_.empty(); }

  float& at(int channel, int rank, int file) { return data_[index(channel, rank, file)]; }
  float at(int channel, int rank, int file) const { return data_[index(channel, rank, file)]; }

  std::span<float> plane(int channel);
  std::span<const float> plane(int channel) const;

  float* data() { return data_.data(); }
  const float* data() const { return data_.data(); }
  std::span<const float> values() const { return {data_.data(), data_.size()}; }

  void fill_plane(int channel, float value);

  float sum() const;
  float plane_sum(int channel) const;

  // Exact, element-wise.
  bool operator==(const PlaneTensor& o) const = default;

private:
  std::size_t index(int channel, int rank, int file) const {
    return (static_cast<std::size_t>(channel) * static_cast<std::size_t>(ranks_) +
            static_cast<std::size_t>(rank)) * static_cast<std::size_t>(files_) +
           static_cast<std::size_t>(file);
  }

  int channels_ = 0;
  int ranks_ = 0;
  int files_ = 0;
  std::vector<float> data_;
};

struct ChannelPiece {
  Piece piece = Piece::None;
  Color color = Color::White;
};

// Pawn..King => 0..5, +6 for Black.
int piece_channel(Piece p, Color c);

// Inverse of piece_channel for channels 0..11; Piece::None otherwise.
ChannelPiece channel_piece(int channel);

// True for 8x8 tensors with exactly 12 or 19 channels.
bool has_valid_shape(const PlaneTensor& t);

// Throws InvalidShape (naming `what`) unless has_valid_shape(t).
void require_valid_shape(const PlaneTensor& t, const char* what);

std::string shape_string(const PlaneTensor& t);

} // namespace chessplanes
