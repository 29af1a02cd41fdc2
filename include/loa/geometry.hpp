#pragma once
#include <array>
#include <cstdint>
#include "loa/types.hpp"

namespace loa {

// Direction indices (clockwise from N, then diagonals). opposite_dir(d) = d ^ 2
// for the orthogonals and the diagonals alike.
enum : int { DIR_N=0, DIR_E=1, DIR_S=2, DIR_W=3, DIR_NE=4, DIR_SE=5, DIR_SW=6, DIR_NW=7, DIR_NONE=-1 };

constexpr int DIR_N_COUNT = 8;

inline constexpr int opposite_dir(int d) { return d ^ 2; }

struct GeometryTables {
  // 8 neighbors (fewer on the edges)
  std::array<std::array<Square,8>,64> adj{};
  std::array<uint8_t,64>              adj_sz{};

  // Rays: for each direction, up to 7 squares to the edge
  std::array<std::array<std::array<Square,7>,64>,8> rays{};
  std::array<std::array<uint8_t,64>,8>              ray_len{};

  // direction of [from][to], DIR_NONE if not on a common line
  std::array<std::array<int8_t,64>,64> dir_between{};
};

// Singleton accessor (built once, reused everywhere)
const GeometryTables& GEO();

inline bool is_valid(Square s) { return s >= 0 && s < SQUARE_N; }

// Compass direction from `from` to `to`, DIR_NONE if they do not share a line.
inline int direction(Square from, Square to) { return GEO().dir_between[from][to]; }

// Line distance (Chebyshev) between two squares.
int distance(Square a, Square b);

// Square reached by moving `steps` squares along `dir`, or -1 if off the board.
Square move_dest(Square from, int dir, int steps);

bool adjacent(Square a, Square b);

} // namespace loa
