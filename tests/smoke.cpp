#include <cassert>
#include "loa/board.hpp"


int main() {
using namespace loa;
Board a, b;
// Same init yields same hash
assert(a.hash() == b.hash());
assert(a == b);
a.set(make_square(3, 3), Piece::White);
assert(a.hash() != b.hash());
assert(a != b);
a.set(make_square(3, 3), Piece::Empty);
assert(a.hash() == b.hash());
// Side to move is part of the key
a.set_side_to_move(Piece::White);
assert(a.hash() != b.hash());
return 0;
}
