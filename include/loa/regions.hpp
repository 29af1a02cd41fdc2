#pragma once
#include <vector>
#include "loa/types.hpp"

namespace loa {

class Board;

// Sizes of the maximal 8-connected groups of `side`, sorted largest first.
// Empty if `side` has no pieces on the board.
std::vector<int> compute_regions(const Board& b, Piece side);

} // namespace loa
