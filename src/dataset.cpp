// src/dataset.cpp

#include "chessplanes/dataset.hpp"

#include "chessplanes/encode.hpp"
#include "chessplanes/fen.hpp"
#include "chessplanes/flip.hpp"

#include <cstddef>
#include <cstring>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

namespace chessplanes {
namespace {

static void set_err(std::string* outErr, const std::string& msg) {
  if (outErr) *outErr = msg;
}

static bool write_f32_vec(std::ofstream& out, std::span<const float> v) {
  if (v.empty()) return true;
  out.write(reinterpret_cast<const char*>(v.data()), static_cast<std::streamsize>(v.size() * sizeof(float)));
  return static_cast<bool>(out);
}

static std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return "";
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

} // namespace

bool write_plane_dataset(
  const std::string& outPath,
  const std::vector<PlaneTensor>& records,
  std::uint32_t flags,
  std::string* outErr
) {
  if (records.empty()) {
    set_err(outErr, "no records to write: " + outPath);
    return false;
  }

  const int channels = records.front().channels();
  for (std::size_t i = 0; i < records.size(); ++i) {
    const PlaneTensor& t = records[i];
    if (!has_valid_shape(t) || t.channels() != channels) {
      set_err(outErr, "record " + std::to_string(i) + " has shape " + shape_string(t) +
                      ", expected (" + std::to_string(channels) + ",8,8)");
      return false;
    }
  }

  std::ofstream out(outPath, std::ios::binary);
  if (!out) {
    set_err(outErr, "could not open dataset for write: " + outPath);
    return false;
  }

  // Write header with placeholder record_count, then patch it at the end.
  DatasetHeader hdr{};
  std::memcpy(hdr.magic, DATASET_MAGIC, sizeof(hdr.magic));
  hdr.version = DATASET_VERSION;
  hdr.channels = static_cast<std::uint32_t>(channels);
  hdr.record_count = 0;
  hdr.flags = flags;
  hdr.reserved = 0;

  out.write(reinterpret_cast<const char*>(&hdr), sizeof(hdr));
  if (!out) {
    set_err(outErr, "failed writing dataset header: " + outPath);
    return false;
  }

  std::uint64_t record_count = 0;
  for (const PlaneTensor& t : records) {
    if (!write_f32_vec(out, t.values())) {
      set_err(outErr, "write failed while writing dataset: " + outPath);
      return false;
    }
    ++record_count;
  }

  // Patch header record_count
  hdr.record_count = record_count;
  out.seekp(0, std::ios::beg);
  out.write(reinterpret_cast<const char*>(&hdr), sizeof(hdr));
  if (!out) {
    set_err(outErr, "failed to patch dataset header: " + outPath);
    return false;
  }

  out.flush();
  if (!out) {
    set_err(outErr, "failed flushing dataset: " + outPath);
    return false;
  }
  return true;
}

bool read_plane_dataset(const std::string& path, PlaneDataset& out, std::string* outErr) {
  out = PlaneDataset{};

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    set_err(outErr, "could not open dataset for read: " + path);
    return false;
  }

  in.seekg(0, std::ios::end);
  const std::uint64_t file_size = static_cast<std::uint64_t>(in.tellg());
  in.seekg(0, std::ios::beg);

  DatasetHeader hdr{};
  if (file_size < sizeof(hdr) || !in.read(reinterpret_cast<char*>(&hdr), sizeof(hdr))) {
    set_err(outErr, "dataset too short for header: " + path);
    return false;
  }
  if (std::memcmp(hdr.magic, DATASET_MAGIC, sizeof(hdr.magic)) != 0) {
    set_err(outErr, "bad dataset magic: " + path);
    return false;
  }
  if (hdr.version != DATASET_VERSION) {
    set_err(outErr, "unsupported dataset version " + std::to_string(hdr.version) + ": " + path);
    return false;
  }
  if (hdr.channels != static_cast<std::uint32_t>(PlaneLayout::kBasicChannels) &&
      hdr.channels != static_cast<std::uint32_t>(PlaneLayout::kExtendedChannels)) {
    set_err(outErr, "unsupported channel count " + std::to_string(hdr.channels) + ": " + path);
    return false;
  }

  const std::uint64_t record_floats = static_cast<std::uint64_t>(hdr.channels) * PlaneLayout::kPlaneSize;
  const std::uint64_t record_size = record_floats * sizeof(float);
  const std::uint64_t payload = file_size - sizeof(hdr);
  if (hdr.record_count > payload / record_size || payload != hdr.record_count * record_size) {
    set_err(outErr, "dataset size " + std::to_string(file_size) + " does not match " +
                    std::to_string(hdr.record_count) + " records: " + path);
    return false;
  }

  out.header = hdr;
  out.records.reserve(static_cast<std::size_t>(hdr.record_count));

  std::vector<float> buf(static_cast<std::size_t>(record_floats));
  for (std::uint64_t i = 0; i < hdr.record_count; ++i) {
    if (!in.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(record_size))) {
      set_err(outErr, "read failed at record " + std::to_string(i) + ": " + path);
      out = PlaneDataset{};
      return false;
    }
    out.records.push_back(PlaneTensor::from_values(buf, static_cast<int>(hdr.channels)));
  }
  return true;
}

bool encode_fen_file(
  const std::string& fenPath,
  const FenEncodeConfig& cfg,
  std::vector<PlaneTensor>& out,
  DatasetGenStats* outStats,
  std::string* outErr
) {
  if (outStats) *outStats = DatasetGenStats{};

  std::ifstream in(fenPath);
  if (!in) {
    set_err(outErr, "could not open FEN list: " + fenPath);
    return false;
  }

  const std::size_t first = out.size();
  DatasetGenStats st{};
  std::string line;
  std::uint64_t lineNo = 0;
  while (std::getline(in, line)) {
    ++lineNo;
    const std::string fen = trim(line);
    if (fen.empty() || fen[0] == '#') continue;
    ++st.lines;

    Board b;
    try {
      set_from_fen(b, fen);
    } catch (const FenError& e) {
      set_err(outErr, fenPath + ":" + std::to_string(lineNo) + ": " + e.what());
      out.erase(out.begin() + static_cast<std::ptrdiff_t>(first), out.end());
      return false;
    }

    PlaneTensor x = cfg.extended ? encode_extended(b) : encode_basic(b);
    ++st.positions;
    if (cfg.withFlips) {
      PlaneTensor y = flip(x);
      out.push_back(std::move(x));
      out.push_back(std::move(y));
      st.records += 2;
    } else {
      out.push_back(std::move(x));
      ++st.records;
    }
  }

  if (outStats) *outStats = st;
  return true;
}

} // namespace chessplanes
