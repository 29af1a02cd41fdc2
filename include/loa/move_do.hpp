#pragma once
#include <stdexcept>
#include "loa/move.hpp"
#include "loa/board.hpp"

namespace loa {

// Precondition violation: illegal move applied, or retract on empty history.
struct IllegalMoveError : std::logic_error { using std::logic_error::logic_error; };

// Requires is_legal(b, m); throws IllegalMoveError otherwise. The recorded
// capture flag is taken from the board, not from `m`.
void make_move(Board& b, const Move& m);

// Undo the last applied move. Throws IllegalMoveError if there is none.
void retract(Board& b);

// Applies a move for the lifetime of the guard.
class MoveGuard {
public:
  MoveGuard(Board& b, const Move& m) : b_(b) { make_move(b_, m); }
  ~MoveGuard() { retract(b_); }
  MoveGuard(const MoveGuard&) = delete;
  MoveGuard& operator=(const MoveGuard&) = delete;

private:
  Board& b_;
};

} // namespace loa
