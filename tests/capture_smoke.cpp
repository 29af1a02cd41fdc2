#include <cassert>
#include <iostream>

#include "loa/board.hpp"
#include "loa/move_do.hpp"
#include "loa/notation.hpp"

int main() {
  using namespace loa;

  Board b;
  const Board start = b;
  const Square c1 = parse_square("c1");
  const Square a3 = parse_square("a3");

  assert(b.piece_count(Piece::White) == 12);
  assert(b.piece_count(Piece::Black) == 12);

  Move m = string_to_move(b, "c1xa3");
  assert(m.capture);
  make_move(b, m);

  assert(b.get(a3) == Piece::Black);
  assert(b.get(c1) == Piece::Empty);
  assert(b.piece_count(Piece::White) == 11);
  assert(b.piece_count(Piece::Black) == 12);
  assert(b.history().back().capture);
  assert(b.side_to_move() == Piece::White);

  retract(b);

  assert(b.get(a3) == Piece::White);
  assert(b.get(c1) == Piece::Black);
  assert(b.piece_count(Piece::White) == 12);
  assert(b.piece_count(Piece::Black) == 12);
  assert(b == start);
  assert(b.hash() == start.hash());

  // Same on the other wing; the dash form still resolves to the capture.
  make_move(b, string_to_move(b, "f1-h3"));   // black takes h3
  assert(b.get(parse_square("h3")) == Piece::Black);
  assert(b.piece_count(Piece::White) == 11);
  retract(b);
  assert(b == start);

  std::cout << "capture_smoke ok\n";
  return 0;
}
