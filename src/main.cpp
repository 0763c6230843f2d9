#include <cstdint>
#include <exception>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "chessplanes/board.hpp"
#include "chessplanes/dataset.hpp"
#include "chessplanes/decode.hpp"
#include "chessplanes/encode.hpp"
#include "chessplanes/fen.hpp"
#include "chessplanes/flip.hpp"
#include "chessplanes/uci.hpp"
#include "chessplanes/visualize.hpp"

using namespace chessplanes;

static void usage() {
  std::cout <<
    "chessplanes CLI\n"
    "Usage:\n"
    "  chessplanes_cli encode [--extended] [--channel <N>] [--moves <uci...> --] [fen...]\n"
    "  chessplanes_cli flip [--extended] [--channel <N>] [fen...]\n"
    "  chessplanes_cli roundtrip [--strict] [fen...]\n"
    "  chessplanes_cli dataset <out.bin> <fens.txt> [--extended] [--flip]\n"
    "  chessplanes_cli inspect <dataset.bin> [index] [--channel <N>]\n"
    "If FEN omitted, uses startpos.\n";
}

static std::string join_from(const std::vector<std::string>& a, size_t i) {
  if (i >= a.size()) return "";
  std::ostringstream oss;
  for (size_t k = i; k < a.size(); ++k) {
    if (k > i) oss << ' ';
    oss << a[k];
  }
  return oss.str();
}

static int to_int(const std::string& s) {
  return std::stoi(s);
}

struct EncodeArgs {
  bool extended = false;
  bool strict = false;
  bool flipAugment = false;
  int channel = -1;
  std::vector<std::string> moves;
  std::vector<std::string> rest; // positional arguments, FEN fields included
};

static EncodeArgs parse_args(const std::vector<std::string>& a, size_t start) {
  EncodeArgs out;
  for (size_t i = start; i < a.size(); ++i) {
    const std::string& tok = a[i];
    if (tok == "--extended") { out.extended = true; continue; }
    if (tok == "--strict")   { out.strict = true; continue; }
    if (tok == "--flip")     { out.flipAugment = true; continue; }
    if (tok == "--channel") {
      if (i + 1 >= a.size()) throw std::invalid_argument("--channel needs a value");
      out.channel = to_int(a[++i]);
      continue;
    }
    if (tok == "--moves") {
      for (++i; i < a.size() && a[i] != "--"; ++i) out.moves.push_back(a[i]);
      continue;
    }
    out.rest.push_back(tok);
  }
  return out;
}

static Board board_from_args(const EncodeArgs& ea) {
  Board b;
  if (!ea.rest.empty()) set_from_fen(b, join_from(ea.rest, 0));
  else set_from_fen(b, STARTPOS_FEN);
  apply_uci_moves(b, ea.moves);
  return b;
}

static void show(const PlaneTensor& x, int channel) {
  if (channel >= 0) render_channel(std::cout, x, channel);
  else render(std::cout, x);
}

static int run(const std::vector<std::string>& args) {
  const std::string cmd = args[0];

  // encode [--extended] [--channel N] [--moves ... --] [fen...]
  if (cmd == "encode") {
    const EncodeArgs ea = parse_args(args, 1);
    const Board b = board_from_args(ea);
    const PlaneTensor x = ea.extended ? encode_extended(b) : encode_basic(b);
    std::cout << "fen " << to_fen(b) << "\n"
              << "shape " << shape_string(x) << " sum " << x.sum() << "\n";
    show(x, ea.channel);
    return 0;
  }

  // flip [--extended] [--channel N] [fen...]
  if (cmd == "flip") {
    const EncodeArgs ea = parse_args(args, 1);
    const Board b = board_from_args(ea);
    const PlaneTensor x = ea.extended ? encode_extended(b) : encode_basic(b);
    show(flip(x), ea.channel);
    return 0;
  }

  // roundtrip [--strict] [fen...]
  if (cmd == "roundtrip") {
    const EncodeArgs ea = parse_args(args, 1);
    const Board b = board_from_args(ea);
    DecodeOptions opt;
    opt.strict = ea.strict;
    const Board back = decode(encode_basic(b), opt);
    std::cout << "in  " << placement_fen(b) << "\n"
              << "out " << placement_fen(back) << "\n"
              << (b.same_placement(back) ? "match" : "MISMATCH") << "\n";
    return b.same_placement(back) ? 0 : 1;
  }

  // dataset <out.bin> <fens.txt> [--extended] [--flip]
  if (cmd == "dataset") {
    const EncodeArgs ea = parse_args(args, 1);
    if (ea.rest.size() != 2) { usage(); return 1; }

    FenEncodeConfig cfg;
    cfg.extended = ea.extended;
    cfg.withFlips = ea.flipAugment;

    std::vector<PlaneTensor> records;
    DatasetGenStats st;
    std::string err;
    if (!encode_fen_file(ea.rest[1], cfg, records, &st, &err) ||
        !write_plane_dataset(ea.rest[0], records, cfg.withFlips ? DATASET_FLAG_FLIP_AUGMENTED : 0u, &err)) {
      std::cerr << "dataset: " << err << "\n";
      return 1;
    }
    std::cout << "dataset ok positions " << st.positions << " records " << st.records
              << " channels " << records.front().channels() << "\n";
    return 0;
  }

  // inspect <dataset.bin> [index] [--channel N]
  if (cmd == "inspect") {
    const EncodeArgs ea = parse_args(args, 1);
    if (ea.rest.empty()) { usage(); return 1; }

    PlaneDataset ds;
    std::string err;
    if (!read_plane_dataset(ea.rest[0], ds, &err)) {
      std::cerr << "inspect: " << err << "\n";
      return 1;
    }
    std::cout << "version " << ds.header.version
              << " channels " << ds.header.channels
              << " records " << ds.header.record_count
              << " flags " << ds.header.flags << "\n";

    if (ea.rest.size() >= 2) {
      const int idx = to_int(ea.rest[1]);
      if (idx < 0 || static_cast<std::uint64_t>(idx) >= ds.records.size()) {
        std::cerr << "inspect: record index " << idx << " out of range\n";
        return 1;
      }
      show(ds.records[static_cast<size_t>(idx)], ea.channel);
    }
    return 0;
  }

  usage();
  return 1;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  if (args.empty()) { usage(); return 0; }

  try {
    return run(args);
  } catch (const std::exception& e) {
    std::cerr << args[0] << ": " << e.what() << "\n";
    return 1;
  }
}
