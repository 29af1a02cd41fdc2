#pragma once
#include <array>
#include "loa/board.hpp"
#include "loa/random.hpp"

namespace loa {

// Score magnitude of a decided game (positive = White won).
constexpr int WINNING_VALUE = 1'000'000;

// Score bands; one entry is picked per bonus with rand_int(5).
constexpr std::array<int, 5> ZONE1_BAND = {1, 2, 3, 4, 5};
constexpr std::array<int, 5> ZONE2_BAND = {20, 25, 30, 35, 40};
constexpr std::array<int, 5> ZONE3_BAND = {90, 95, 100, 105, 110};

constexpr int EDGE_PENALTY    = 100;
constexpr int SPREAD_PENALTY  = 100; // largest region too small, or > 3 regions
constexpr int MEDIUM          = 50;
constexpr double LOWER_SHARE  = 0.4;
constexpr double UPPER_SHARE  = 0.8;

struct EvalParams {
  bool momentum = true;   // bonus when the score improves on the previous call
};

// Positional heuristic for one side (the searching side). Keeps the result of
// its previous call, so the value depends on call order.
class Evaluator {
public:
  explicit Evaluator(RandomSource& rng, EvalParams params = {}) : rng_(rng), params_(params) {}

  // Positive favors White. `sense` is +1 to score White's features, -1 for Black's.
  int evaluate(const Board& b, int sense);

  // Forget the previous result; the next call gets no momentum bonus.
  void reset() { has_last_ = false; last_ = 0; }
  bool has_last() const { return has_last_; }
  int last() const { return last_; }

  // Band value for a random index.
  int zone2() { return ZONE2_BAND[pick_()]; }

private:
  RandomSource& rng_;
  EvalParams params_;
  bool has_last_ = false;
  int last_ = 0;

  std::size_t pick_();
  int zone1() { return ZONE1_BAND[pick_()]; }
  int zone3() { return ZONE3_BAND[pick_()]; }
  int side_points_(const Board& b, Piece side);
};

// Score of a finished game: +/-WINNING_VALUE, 0 for a draw or a game in progress.
int terminal_score(const Board& b);

// Mean pairwise Chebyshev distance between `side`'s pieces (integer division);
// 0 with fewer than two pieces.
int average_distance(const Board& b, Piece side);

} // namespace loa
