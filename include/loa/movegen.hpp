#pragma once
#include "loa/board.hpp"
#include "loa/movelist.hpp"


namespace loa {


// Pieces of either color on the whole line through `from` along `dir`
// (both ways), `from` itself counted once.
int line_count(const Board& b, Square from, int dir);

// True iff from-to is a legal move for the side to move.
bool is_legal(const Board& b, Square from, Square to);
inline bool is_legal(const Board& b, const Move& m) { return is_legal(b, m.from, m.to); }

// All legal moves for the side to move, ordered by source then destination.
void generate_legal(const Board& b, MoveList& out);


} // namespace loa
