#include "loa/perft.hpp"
#include "loa/movegen.hpp"
#include "loa/move_do.hpp"
#include <vector>

namespace loa {

static std::uint64_t perft_mut(Board& b, int depth) {
  if (depth == 0 || b.game_over()) return 1ULL;

  MoveList ml;
  generate_legal(b, ml);

  std::uint64_t nodes = 0ULL;
  for (const auto& m : ml) {
    make_move(b, m);
    nodes += perft_mut(b, depth - 1);
    retract(b);
  }
  return nodes;
}

std::uint64_t perft(const Board& b, int depth) {
  Board copy = b;              // copy once at root
  return perft_mut(copy, depth);
}

void perft_divide(const Board& b, int depth,
                  std::vector<std::pair<Move, std::uint64_t>>& out) {
  out.clear();
  if (depth <= 0 || b.game_over()) return;

  Board root = b;
  MoveList ml;
  generate_legal(root, ml);

  for (const auto& m : ml) {
    make_move(root, m);
    out.emplace_back(m, perft_mut(root, depth - 1));
    retract(root);
  }
}

} // namespace loa
