#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include "loa/board.hpp"
#include "loa/move.hpp"
#include "loa/notation.hpp"


static bool throws_notation(const char* text) {
  loa::Board b;
  try {
    loa::set_from_text(b, text);
  } catch (const loa::NotationError&) {
    return true;
  }
  return false;
}


int main() {
using namespace loa;


// Default board is the start position
Board b0;
assert(to_text(b0) == STARTPOS);


// Round-trip startpos
Board b1;
set_from_text(b1, STARTPOS);
assert(to_text(b1) == STARTPOS);
assert(b1 == b0);
assert(b1.side_to_move() == Piece::Black);


// Dash form is accepted and written back with digit runs
Board b2;
set_from_text(b2, "b------w/8/5w2/4w3/8/8/8/www----b w");
assert(to_text(b2) == "b6w/8/5w2/4w3/8/8/8/www4b w");
assert(b2.get(make_square(0, 7)) == Piece::Black);
assert(b2.get(make_square(4, 4)) == Piece::White);
assert(b2.side_to_move() == Piece::White);


// Optional move limit (moves per side)
Board b3;
set_from_text(b3, "b6w/8/5w2/4w3/8/8/8/www4b w 30");
assert(b3.move_limit() == 60);
assert(to_text(b3) == "b6w/8/5w2/4w3/8/8/8/www4b w 30");


// Malformed input
assert(throws_notation(""));
assert(throws_notation("8/8/8/8/8/8/8/8"));
assert(throws_notation("8/8 w"));
assert(throws_notation("9/8/8/8/8/8/8/8 w"));
assert(throws_notation("x7/8/8/8/8/8/8/8 w"));
assert(throws_notation("8/8/8/8/8/8/8/8/8 w"));
assert(throws_notation("7/8/8/8/8/8/8/8 w"));
assert(throws_notation("8/8/8/8/8/8/8/8 z"));
assert(throws_notation("8/8/8/8/8/8/8/8 w ten"));
assert(throws_notation("8/8/8/8/8/8/8/8 w 0"));


// Squares
assert(parse_square("a1") == 0);
assert(parse_square("h8") == 63);
assert(square_name(make_square(2, 0)) == "c1");
bool threw = false;
try { (void)parse_square("i1"); } catch (const std::invalid_argument&) { threw = true; }
assert(threw);


// Moves are resolved against the legal list
Move m = string_to_move(b0, "b1-b3");
assert(m.from == parse_square("b1") && m.to == parse_square("b3"));
assert(!m.capture);
assert(move_to_string(m) == "b1-b3");

Move c = string_to_move(b0, "c1a3");
assert(c.capture);
assert(move_to_string(c) == "c1xa3");

threw = false;
try { (void)string_to_move(b0, "b1-b4"); } catch (const std::invalid_argument&) { threw = true; }
assert(threw);

threw = false;
try { (void)string_to_move(b0, "a2-c2"); } catch (const std::invalid_argument&) { threw = true; } // white piece, black to move
assert(threw);


std::cout << "notation ok\n";
return 0;
}
