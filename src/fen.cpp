#include "chessplanes/fen.hpp"
#include <sstream>
#include <string>

namespace chessplanes {

static inline bool is_digit(char c) { return c >= '0' && c <= '9'; }

static int to_clock(const std::string& s, const char* what) {
  std::size_t used = 0;
  int v = 0;
  try {
    v = std::stoi(s, &used);
  } catch (const std::exception&) {
    throw FenError(std::string("Invalid ") + what + " in FEN: " + s);
  }
  if (used != s.size() || v < 0) throw FenError(std::string("Invalid ") + what + " in FEN: " + s);
  return v;
}

static inline Piece char_to_piece(char c, Color& out_color) {
  switch (c) {
    case 'P': out_color = Color::White; return Piece::Pawn;
    case 'N': out_color = Color::White; return Piece::Knight;
    case 'B': out_color = Color::White; return Piece::Bishop;
    case 'R': out_color = Color::White; return Piece::Rook;
    case 'Q': out_color = Color::White; return Piece::Queen;
    case 'K': out_color = Color::White; return Piece::King;
    case 'p': out_color = Color::Black; return Piece::Pawn;
    case 'n': out_color = Color::Black; return Piece::Knight;
    case 'b': out_color = Color::Black; return Piece::Bishop;
    case 'r': out_color = Color::Black; return Piece::Rook;
    case 'q': out_color = Color::Black; return Piece::Queen;
    case 'k': out_color = Color::Black; return Piece::King;
    default:  out_color = Color::White; return Piece::None;
  }
}

char piece_to_char(Piece p, Color c) {
  const char* W = "PNBRQK";
  const char* B = "pnbrqk";
  if (p == Piece::None) return '.';
  int idx = static_cast<int>(p);
  return (c == Color::White ? W[idx] : B[idx]);
}

static void parse_placement(Board& b, const std::string& placement) {
  int r = 7, f = 0;
  for (char ch : placement) {
    if (ch == '/') {
      if (f != 8) throw FenError("FEN rank does not cover 8 files");
      --r; f = 0;
      if (r < 0) throw FenError("FEN has more than 8 ranks");
      continue;
    }
    if (is_digit(ch)) {
      if (ch == '0' || ch == '9') throw FenError("Invalid empty-run digit in FEN");
      f += ch - '0';
      if (f > 8) throw FenError("FEN rank overflows 8 files");
      continue;
    }
    Color col; Piece p = char_to_piece(ch, col);
    if (p == Piece::None) throw FenError("Invalid piece character in FEN");
    if (f > 7) throw FenError("FEN rank overflows 8 files");
    b.set_piece(col, p, make_square(f, r));
    ++f;
  }
  if (r != 0 || f != 8) throw FenError("FEN placement must describe 8 ranks of 8 files");
}

void set_from_fen(Board& b, std::string_view fen) {
  b.clear();

  std::string fen_str(fen);
  std::istringstream ss(fen_str);
  std::string placement, active, castling, ep;
  std::string half = "0", full = "1";
  if (!(ss >> placement >> active >> castling >> ep))
    throw FenError("Malformed FEN: expected at least 4 fields");
  if (ss >> half) ss >> full;

  // 1) Piece placement
  parse_placement(b, placement);

  // 2) Active color
  if (active == "w") b.set_side_to_move(Color::White);
  else if (active == "b") b.set_side_to_move(Color::Black);
  else throw FenError("Invalid active color in FEN");

  // 3) Castling rights
  Castling cr{};
  if (castling != "-") {
    for (char cch : castling) {
      if (cch == 'K') cr.set(Color::White, CastleSide::King, true);
      else if (cch == 'Q') cr.set(Color::White, CastleSide::Queen, true);
      else if (cch == 'k') cr.set(Color::Black, CastleSide::King, true);
      else if (cch == 'q') cr.set(Color::Black, CastleSide::Queen, true);
      else throw FenError("Invalid castling char in FEN");
    }
  }
  b.set_castling(cr);

  // 4) En-passant square
  if (ep == "-") {
    b.set_ep_square(NO_SQUARE);
  } else {
    if (ep.size() != 2) throw FenError("Invalid en-passant square in FEN");
    int file = ep[0] - 'a';
    int rank = ep[1] - '1';
    if (file < 0 || file > 7 || rank < 0 || rank > 7) throw FenError("EP square out of range");
    b.set_ep_square(make_square(file, rank));
  }

  // 5) Halfmove & 6) Fullmove clocks
  b.set_halfmove_clock(to_clock(half, "halfmove clock"));
  b.set_fullmove_number(to_clock(full, "fullmove number"));
}

Board board_from_fen(std::string_view fen) {
  Board b;
  set_from_fen(b, fen);
  return b;
}

std::string placement_fen(const Board& b) {
  std::string out;
  for (int r = 7; r >= 0; --r) {
    int empties = 0;
    for (int f = 0; f < 8; ++f) {
      Color c = Color::White;
      Piece p = b.piece_at(make_square(f, r), &c);
      if (p == Piece::None) {
        ++empties;
      } else {
        if (empties) { out += char('0' + empties); empties = 0; }
        out += piece_to_char(p, c);
      }
    }
    if (empties) out += char('0' + empties);
    if (r) out += '/';
  }
  return out;
}

std::string to_fen(const Board& b) {
  std::string out = placement_fen(b);
  out += ' ';

  out += (b.side_to_move() == Color::White ? 'w' : 'b');
  out += ' ';

  const Castling cr = b.castling();
  if (cr.rights == 0) out += '-';
  else {
    if (cr.has(Color::White, CastleSide::King))  out += 'K';
    if (cr.has(Color::White, CastleSide::Queen)) out += 'Q';
    if (cr.has(Color::Black, CastleSide::King))  out += 'k';
    if (cr.has(Color::Black, CastleSide::Queen)) out += 'q';
  }
  out += ' ';

  const Square ep = b.ep_square();
  if (ep < 0) out += '-';
  else {
    out += char('a' + file_of(ep));
    out += char('1' + rank_of(ep));
  }
  out += ' ';

  out += std::to_string(b.halfmove_clock());
  out += ' ';
  out += std::to_string(b.fullmove_number());

  return out;
}

} // namespace chessplanes
