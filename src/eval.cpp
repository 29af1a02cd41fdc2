#include "loa/eval.hpp"
#include "loa/geometry.hpp"
#include "loa/types.hpp"

#include <vector>

namespace loa {

std::size_t Evaluator::pick_() {
  return static_cast<std::size_t>(rng_.rand_int(static_cast<int>(ZONE1_BAND.size())));
}

// Points for `side`, larger = better for `side`. White is scored along the
// files (a and h are its home edges), Black along the ranks.
int Evaluator::side_points_(const Board& b, Piece side) {
  const bool white = (side == Piece::White);
  int points = 0;

  for (Square s = 0; s < SQUARE_N; ++s) {
    if (b.get(s) != side) continue;
    const int axis  = white ? file_of(s) : rank_of(s);
    const int cross = white ? rank_of(s) : file_of(s);

    if (axis >= 1 && axis <= 6) {
      points += zone1();
      if (axis >= 2 && axis <= 5) {
        points += zone2();
        if (cross >= 2 && cross <= 4) points += zone3();
      }
    } else {
      points -= EDGE_PENALTY;
    }
  }

  const std::vector<int>& regions = b.region_sizes(side);
  if (regions.empty()) return points;

  int total = 0;
  for (int r : regions) total += r;
  const int largest = regions.front();
  const std::size_t n = regions.size();

  if (largest < LOWER_SHARE * total) points -= SPREAD_PENALTY;
  if (n > 3) points -= SPREAD_PENALTY;
  if (largest > UPPER_SHARE * total) {
    if (n > 3) points -= MEDIUM;
    else       points += zone3();
  }
  if (n == 2) points += zone2();

  return points;
}

int Evaluator::evaluate(const Board& b, int sense) {
  if (b.game_over()) return terminal_score(b);

  const Piece side = sense >= 0 ? Piece::White : Piece::Black;
  const int sign = sense >= 0 ? 1 : -1;
  int score = sign * side_points_(b, side);

  // Momentum: reward a position that improves on the last one scored.
  if (params_.momentum && has_last_) {
    const bool improved = sign > 0 ? score > last_ : score < last_;
    if (improved) {
      score += sign * (rng_.rand_int(11) >= 5 ? MEDIUM : MEDIUM / 2);
    }
  }

  last_ = score;
  has_last_ = true;
  return score;
}

int terminal_score(const Board& b) {
  switch (b.winner()) {
    case Winner::White: return WINNING_VALUE;
    case Winner::Black: return -WINNING_VALUE;
    default:            return 0;
  }
}

int average_distance(const Board& b, Piece side) {
  std::vector<Square> sq;
  sq.reserve(16);
  for (Square s = 0; s < SQUARE_N; ++s) if (b.get(s) == side) sq.push_back(s);
  if (sq.size() < 2) return 0;

  int sum = 0, pairs = 0;
  for (std::size_t i = 0; i < sq.size(); ++i) {
    for (std::size_t j = 0; j < sq.size(); ++j) {
      if (i == j) continue;
      sum += distance(sq[i], sq[j]);
      ++pairs;
    }
  }
  return sum / pairs;
}

} // namespace loa
