#include "loa/notation.hpp"
#include "loa/movegen.hpp"
#include <sstream>
#include <string>

namespace loa {

static inline bool is_digit(char c) { return c >= '1' && c <= '8'; }

static inline char piece_to_char(Piece p) {
  switch (p) {
    case Piece::White: return 'w';
    case Piece::Black: return 'b';
    default:           return '-';
  }
}

static inline Piece side_from_text(const std::string& s) {
  if (s == "b") return Piece::Black;
  if (s == "w") return Piece::White;
  throw NotationError("Invalid side to move: " + s);
}

void set_from_text(Board& b, std::string_view text) {
  std::istringstream ss{std::string(text)};
  std::string placement, side, limit;
  if (!(ss >> placement >> side))
    throw NotationError("Malformed position: expected placement and side to move");
  ss >> limit;

  Layout layout{};
  for (auto& row : layout) row.fill(Piece::Empty);

  int r = 7, f = 0;
  for (char ch : placement) {
    if (ch == '/') {
      if (f != 8) throw NotationError("Rank does not have 8 squares");
      if (--r < 0) throw NotationError("Too many ranks in position");
      f = 0;
      continue;
    }
    int run = 1;
    Piece p = Piece::Empty;
    if (is_digit(ch)) run = ch - '0';
    else if (ch == 'w' || ch == 'W') p = Piece::White;
    else if (ch == 'b' || ch == 'B') p = Piece::Black;
    else if (ch != '-') throw NotationError(std::string("Invalid character in position: ") + ch);

    if (f + run > 8) throw NotationError("Rank has more than 8 squares");
    for (int i = 0; i < run; ++i, ++f) {
      layout[static_cast<std::size_t>(r)][static_cast<std::size_t>(f)] = p;
    }
  }
  if (r != 0 || f != 8) throw NotationError("Position must have 8 ranks of 8 squares");

  const Piece turn = side_from_text(side);

  int limitMoves = DEFAULT_MOVE_LIMIT;
  if (!limit.empty()) {
    std::size_t used = 0;
    try {
      limitMoves = std::stoi(limit, &used);
    } catch (const std::exception&) {
      throw NotationError("Invalid move limit: " + limit);
    }
    if (used != limit.size() || limitMoves <= 0) throw NotationError("Invalid move limit: " + limit);
  }

  b.initialize(layout, turn);
  b.set_move_limit(limitMoves);
}

std::string to_text(const Board& b) {
  std::string out;

  for (int r = 7; r >= 0; --r) {
    int empties = 0;
    for (int f = 0; f < 8; ++f) {
      Piece p = b.get(make_square(f, r));
      if (p == Piece::Empty) {
        ++empties;
      } else {
        if (empties) { out += char('0' + empties); empties = 0; }
        out += piece_to_char(p);
      }
    }
    if (empties) out += char('0' + empties);
    if (r) out += '/';
  }
  out += ' ';
  out += (b.side_to_move() == Piece::White ? 'w' : 'b');

  if (b.move_limit() != 2 * DEFAULT_MOVE_LIMIT) {
    out += ' ';
    out += std::to_string(b.move_limit() / 2);
  }
  return out;
}

std::string square_name(Square s) {
  std::string out;
  out += char('a' + file_of(s));
  out += char('1' + rank_of(s));
  return out;
}

Square parse_square(std::string_view s) {
  if (s.size() != 2) throw std::invalid_argument("bad square length");
  const char f = s[0];
  const char r = s[1];
  if (f < 'a' || f > 'h' || r < '1' || r > '8')
    throw std::invalid_argument("bad square");
  return make_square(f - 'a', r - '1');
}

std::string move_to_string(const Move& m) {
  return square_name(m.from) + (m.capture ? 'x' : '-') + square_name(m.to);
}

Move string_to_move(const Board& b, const std::string& s) {
  std::string_view from, to;
  if (s.size() == 5 && (s[2] == '-' || s[2] == 'x')) {
    from = std::string_view(s).substr(0, 2);
    to   = std::string_view(s).substr(3, 2);
  } else if (s.size() == 4) {
    from = std::string_view(s).substr(0, 2);
    to   = std::string_view(s).substr(2, 2);
  } else {
    throw std::invalid_argument("bad move length");
  }

  const Square f = parse_square(from);
  const Square t = parse_square(to);

  MoveList ml;
  generate_legal(b, ml);
  for (const auto& m : ml) {
    if (m.from == f && m.to == t) return m;
  }
  throw std::invalid_argument("move not found among legal moves: " + s);
}

std::string to_diagram(const Board& b) {
  std::ostringstream out;
  out << "===\n";
  for (int r = 7; r >= 0; --r) {
    out << "  " << (r + 1) << ' ';
    for (int f = 0; f < 8; ++f) out << piece_to_char(b.get(make_square(f, r))) << ' ';
    out << '\n';
  }
  out << "    a b c d e f g h\n";
  out << "Next move: " << (b.side_to_move() == Piece::White ? "white" : "black") << "\n===";
  return out.str();
}

} // namespace loa
