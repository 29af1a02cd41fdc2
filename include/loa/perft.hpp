#pragma once
#include <cstdint>
#include <utility>
#include <vector>
#include "loa/types.hpp"
#include "loa/board.hpp"
#include "loa/move.hpp"

namespace loa {

// Leaves of the legal move tree at `depth`. Finished games are leaves.
std::uint64_t perft(const Board& b, int depth);

// Per-move breakdown at root
void perft_divide(const Board& b, int depth,
                  std::vector<std::pair<Move, std::uint64_t>>& out);

} // namespace loa
