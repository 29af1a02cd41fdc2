#include "loa/move_do.hpp"
#include "loa/movegen.hpp"
#include "loa/notation.hpp"

namespace loa {

void make_move(Board& b, const Move& m) {
  if (!is_legal(b, m)) {
    throw IllegalMoveError("illegal move " + move_to_string(m));
  }

  const Piece us = b.side_to_move();
  const Piece dst = b.get(m.to);

  Move rec = m;
  rec.capture = (dst == opposite(us));
  rec.score = 0;

  b.put_piece_(m.to, us);
  b.put_piece_(m.from, Piece::Empty);
  b.set_side_to_move(opposite(us));
  b.push_history_(rec);
}

void retract(Board& b) {
  if (b.moves_made() == 0) {
    throw IllegalMoveError("retract with no moves made");
  }

  const Move last = b.history().back();
  const Piece mover = b.get(last.to);

  b.put_piece_(last.from, mover);
  b.put_piece_(last.to, last.capture ? opposite(mover) : Piece::Empty);
  b.set_side_to_move(mover);
  b.pop_history_();
}

} // namespace loa
