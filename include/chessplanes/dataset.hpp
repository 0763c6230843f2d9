#pragma once

#include <bit>
#include <cstdint>
#include <string>
#include <vector>

#include "chessplanes/planes.hpp"

namespace chessplanes {

// On-disk plane dataset (little-endian):
//   header (32 bytes) followed by record_count records of
//   channels * 64 float32 values in (channel, rank, file) order.
inline constexpr char DATASET_MAGIC[8] = {'C', 'P', 'L', 'A', 'N', 'E', 'S', '1'};
constexpr std::uint32_t DATASET_VERSION = 1;

// Each source position is followed by its flipped encoding.
constexpr std::uint32_t DATASET_FLAG_FLIP_AUGMENTED = 1u << 0;

struct DatasetHeader {
  char magic[8];
  std::uint32_t version;
  std::uint32_t channels;
  std::uint64_t record_count;
  std::uint32_t flags;
  std::uint32_t reserved;
};
static_assert(sizeof(DatasetHeader) == 32, "dataset header must be 32 bytes");
// Headers and records are written in host byte order.
static_assert(std::endian::native == std::endian::little, "dataset format is little-endian");

struct PlaneDataset {
  DatasetHeader header{};
  std::vector<PlaneTensor> records;
};

struct FenEncodeConfig {
  bool extended = false;   // 19 channels instead of 12
  bool withFlips = false;  // append flip(x) after every x
};

struct DatasetGenStats {
  std::uint64_t lines = 0;      // non-blank, non-comment lines read
  std::uint64_t positions = 0;  // positions encoded
  std::uint64_t records = 0;    // tensors produced (positions, plus flips)
};

// All records must share one valid shape. Returns false and fills outErr on failure.
bool write_plane_dataset(
  const std::string& outPath,
  const std::vector<PlaneTensor>& records,
  std::uint32_t flags,
  std::string* outErr = nullptr
);

// Validates magic, version, channel count and exact file size.
bool read_plane_dataset(
  const std::string& path,
  PlaneDataset& out,
  std::string* outErr = nullptr
);

// One FEN per line; blank lines and lines starting with '#' are skipped.
// Stops at the first malformed FEN, reporting its line number; tensors
// appended by this call are removed again, so out keeps only what it held
// before.
bool encode_fen_file(
  const std::string& fenPath,
  const FenEncodeConfig& cfg,
  std::vector<PlaneTensor>& out,
  DatasetGenStats* outStats = nullptr,
  std::string* outErr = nullptr
);

} // namespace chessplanes
