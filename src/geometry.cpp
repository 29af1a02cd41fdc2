#include "loa/geometry.hpp"
#include <cstdlib>


namespace loa {

static GeometryTables build() {
  GeometryTables T{};

  for (auto& row : T.dir_between) row.fill(static_cast<int8_t>(DIR_NONE));

  // Neighbors: 8 around
  for (int s = 0; s < 64; ++s) {
    int f0 = file_of(s), r0 = rank_of(s);
    int n = 0;
    for (int df = -1; df <= 1; ++df) {
      for (int dr = -1; dr <= 1; ++dr) {
        if (!df && !dr) continue;
        int f = f0 + df, r = r0 + dr;
        if (!on_board(f, r)) continue;
        T.adj[s][n++] = make_square(f, r);
      }
    }
    T.adj_sz[s] = static_cast<uint8_t>(n);
  }

  // Rays
  auto push_ray = [&](int s, int df, int dr, int dir_idx) {
    int f = file_of(s) + df, r = rank_of(s) + dr;
    int n = 0;
    while (on_board(f, r)) {
      const Square t = make_square(f, r);
      T.rays[dir_idx][s][n++] = t;
      T.dir_between[s][t] = static_cast<int8_t>(dir_idx);
      f += df; r += dr;
    }
    T.ray_len[dir_idx][s] = static_cast<uint8_t>(n);
  };

  for (int s = 0; s < 64; ++s) {
    push_ray(s,  0,+1, DIR_N);
    push_ray(s, +1, 0, DIR_E);
    push_ray(s,  0,-1, DIR_S);
    push_ray(s, -1, 0, DIR_W);
    push_ray(s, +1,+1, DIR_NE);
    push_ray(s, +1,-1, DIR_SE);
    push_ray(s, -1,-1, DIR_SW);
    push_ray(s, -1,+1, DIR_NW);
  }

  return T;
}

const GeometryTables& GEO() {
  static GeometryTables T = build();
  return T;
}

int distance(Square a, Square b) {
  const int df = std::abs(file_of(a) - file_of(b));
  const int dr = std::abs(rank_of(a) - rank_of(b));
  return df > dr ? df : dr;
}

Square move_dest(Square from, int dir, int steps) {
  if (!is_valid(from) || dir < 0 || dir >= DIR_N_COUNT) return -1;
  if (steps == 0) return from;
  if (steps < 0 || steps > GEO().ray_len[dir][from]) return -1;
  return GEO().rays[dir][from][steps - 1];
}

bool adjacent(Square a, Square b) {
  return a != b && distance(a, b) == 1;
}

} // namespace loa
