#include "loa/movegen.hpp"
#include "loa/geometry.hpp"
#include "loa/types.hpp"

namespace loa {

int line_count(const Board& b, Square from, int dir) {
  const auto& G = GEO();
  int count = 1;
  for (int d : {dir, opposite_dir(dir)}) {
    for (int i = 0; i < G.ray_len[d][from]; ++i) {
      if (b.get(G.rays[d][from][i]) != Piece::Empty) ++count;
    }
  }
  return count;
}

bool is_legal(const Board& b, Square from, Square to) {
  if (!is_valid(from) || !is_valid(to)) return false;

  const Piece us = b.side_to_move();
  if (b.get(from) != us) return false;

  const int dir = direction(from, to);
  if (dir == DIR_NONE) return false;

  if (b.get(to) == us) return false;

  const int steps = distance(from, to);
  if (steps != line_count(b, from, dir)) return false;

  // May pass over our own pieces, never over an enemy.
  const auto& G = GEO();
  const Piece them = opposite(us);
  for (int i = 0; i < steps - 1; ++i) {
    if (b.get(G.rays[dir][from][i]) == them) return false;
  }
  return true;
}

void generate_legal(const Board& b, MoveList& out) {
  out.clear();

  const Piece us  = b.side_to_move();
  const Piece opp = opposite(us);

  for (Square s = 0; s < SQUARE_N; ++s) {
    if (b.get(s) != us) continue;
    for (Square t = 0; t < SQUARE_N; ++t) {
      if (t == s || !is_legal(b, s, t)) continue;
      out.push(Move{ s, t, b.get(t) == opp, 0 });
    }
  }
}

} // namespace loa
