#include <cassert>
#include <iostream>

#include "loa/board.hpp"
#include "loa/move_do.hpp"
#include "loa/notation.hpp"

int main() {
  using namespace loa;

  // 1) Default limit: 60 moves per side, counted in plies.
  {
    Board b;
    assert(b.move_limit() == 2 * DEFAULT_MOVE_LIMIT);
    b.set_move_limit(1);
    assert(b.move_limit() == 2);
  }

  // 2) Reaching the limit without a connection is a draw.
  {
    Board b;
    b.set_move_limit(1);
    make_move(b, string_to_move(b, "b1-b3"));
    assert(b.winner() == Winner::Unknown);
    make_move(b, string_to_move(b, "a2-c2"));
    assert(b.moves_made() == 2);
    assert(!b.pieces_contiguous(Piece::White));
    assert(!b.pieces_contiguous(Piece::Black));
    assert(b.winner() == Winner::Draw);
    assert(b.game_over());

    // Retracting below the limit reopens the game.
    retract(b);
    assert(b.winner() == Winner::Unknown);
  }

  // 3) Raising the limit on a drawn board clears the cached result.
  {
    Board b;
    b.set_move_limit(1);
    make_move(b, string_to_move(b, "b1-b3"));
    make_move(b, string_to_move(b, "a2-c2"));
    assert(b.winner() == Winner::Draw);
    b.set_move_limit(2);
    assert(b.winner() == Winner::Unknown);
  }

  // 4) A connection on the last allowed ply is a win, not a draw.
  {
    Board b;
    set_from_text(b, "5b1b/8/8/8/8/w7/8/w7 b 1");
    make_move(b, string_to_move(b, "f8-f7"));
    assert(b.winner() == Winner::Unknown);
    make_move(b, string_to_move(b, "a3-b2"));
    assert(b.moves_made() == b.move_limit());
    assert(b.winner() == Winner::White);
  }

  std::cout << "draw_rules_smoke ok\n";
  return 0;
}
