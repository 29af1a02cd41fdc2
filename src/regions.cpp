#include "loa/regions.hpp"
#include "loa/board.hpp"
#include "loa/geometry.hpp"

#include <algorithm>
#include <array>
#include <functional>

namespace loa {

std::vector<int> compute_regions(const Board& b, Piece side) {
  std::vector<int> sizes;
  if (side == Piece::Empty) return sizes;

  const auto& G = GEO();
  std::array<bool, SQUARE_N> seen{};
  std::array<Square, SQUARE_N> stack{};

  for (Square s = 0; s < SQUARE_N; ++s) {
    if (seen[static_cast<std::size_t>(s)] || b.get(s) != side) continue;

    // Each square is pushed at most once, so the stack never exceeds 64.
    int top = 0;
    int count = 0;
    stack[static_cast<std::size_t>(top++)] = s;
    seen[static_cast<std::size_t>(s)] = true;
    while (top > 0) {
      const Square q = stack[static_cast<std::size_t>(--top)];
      ++count;
      for (int i = 0; i < G.adj_sz[q]; ++i) {
        const Square n = G.adj[q][i];
        if (seen[static_cast<std::size_t>(n)] || b.get(n) != side) continue;
        seen[static_cast<std::size_t>(n)] = true;
        stack[static_cast<std::size_t>(top++)] = n;
      }
    }
    sizes.push_back(count);
  }

  std::sort(sizes.begin(), sizes.end(), std::greater<int>());
  return sizes;
}

} // namespace loa
