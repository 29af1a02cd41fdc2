#pragma once

#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

#include "loa/board.hpp"
#include "loa/eval.hpp"
#include "loa/movelist.hpp"
#include "loa/random.hpp"

namespace loa {

constexpr int DEFAULT_DEPTH = 2;

struct SearchResult {
  Move best{};
  int score{0};              // positive = White better
  std::uint64_t nodes{0};
  int depth{0};
  std::vector<Move> pv;      // principal variation, best line
};

// Depth is the only limit on work.
struct SearchLimits {
  int depth = DEFAULT_DEPTH;
  bool prune = true;             // false => plain minimax over the same tree
  bool dispersion_bonus = true;  // frontier bonus when the mover tightens its group
  EvalParams eval{};
};

// Called once with every move returned by choose_move().
using MoveReporter = std::function<void(const Move&)>;

// Alpha-beta minimax. White maximizes, Black minimizes. The board passed to
// search() is used in place and is restored before returning.
class Engine {
public:
  explicit Engine(RandomSource& rng, SearchLimits lim = {});

  // Requires !b.game_over() and a legal move; throws std::logic_error otherwise.
  SearchResult search(Board& b);

  // search() and report the chosen move.
  Move choose_move(Board& b);

  void set_reporter(MoveReporter r) { reporter_ = std::move(r); }
  std::uint64_t nodes() const { return nodes_; } // of the last search

private:
  SearchLimits lim_;
  Evaluator eval_;
  MoveReporter reporter_;
  int sense_ = 1;
  std::uint64_t nodes_ = 0;

  int minimax_(Board& b, int depth, int alpha, int beta, std::vector<Move>& pv);
};

} // namespace loa
