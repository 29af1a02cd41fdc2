#include "loa/search.hpp"
#include "loa/movegen.hpp"
#include "loa/move_do.hpp"
#include "loa/eval.hpp"
#include "loa/types.hpp"

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <utility>
#include <vector>

namespace loa {

// Above any reachable score, including a decided game.
static constexpr int INF = 2 * WINNING_VALUE;

Engine::Engine(RandomSource& rng, SearchLimits lim)
  : lim_(lim), eval_(rng, lim.eval) {}

// -----------------------------------------------------------------------------
// Minimax with alpha-beta. The role follows the side to move.
// -----------------------------------------------------------------------------
int Engine::minimax_(Board& b, int depth, int alpha, int beta, std::vector<Move>& pv) {
  nodes_++;

  if (depth == 0 || b.game_over()) {
    pv.clear();
    return eval_.evaluate(b, sense_);
  }

  MoveList ml;
  generate_legal(b, ml);
  if (ml.empty()) {
    pv.clear();
    return eval_.evaluate(b, sense_);
  }

  const Piece us = b.side_to_move();
  const bool maximizing = (us == Piece::White);

  // Dispersion of the mover before its move, for the frontier bonus.
  const bool frontier = (depth == 1 && lim_.dispersion_bonus);
  const int origDist = frontier ? average_distance(b, us) : 0;

  Move bestMove{};
  std::vector<Move> bestChildPV;
  int best = maximizing ? -INF : INF;

  for (auto& m : ml) {
    std::vector<Move> childPV;
    int score;
    {
      MoveGuard guard(b, m);
      score = minimax_(b, depth - 1, alpha, beta, childPV);
      if (frontier && !b.game_over() && average_distance(b, us) < origDist) {
        const int bonus = eval_.zone2();
        score += maximizing ? bonus : -bonus;
      }
    }
    m.score = score;

    // Strict comparison: the first move reaching a value keeps it.
    if (maximizing ? score > best : score < best) {
      best        = score;
      bestMove    = m;
      bestChildPV = std::move(childPV);
    }

    if (lim_.prune) {
      if (maximizing) alpha = std::max(alpha, best);
      else            beta  = std::min(beta, best);
      if (beta <= alpha) break;
    }
  }

  pv.clear();
  pv.push_back(bestMove);
  pv.insert(pv.end(), bestChildPV.begin(), bestChildPV.end());
  return best;
}

// ============================================================================
// Public entry points
// ============================================================================
SearchResult Engine::search(Board& b) {
  if (b.game_over()) {
    throw std::logic_error("search called on a finished game");
  }
  MoveList root;
  generate_legal(b, root);
  if (root.empty()) {
    throw std::logic_error("no legal move");
  }

  SearchResult res{};
  nodes_ = 0;
  sense_ = (b.side_to_move() == Piece::White) ? 1 : -1;

  // Momentum starts from the root position's score.
  eval_.reset();
  (void)eval_.evaluate(b, sense_);

  const int depth = std::max(1, lim_.depth);
  std::vector<Move> pv;
  res.score = minimax_(b, depth, -INF, INF, pv);
  res.best  = pv.front();
  res.pv    = std::move(pv);
  res.nodes = nodes_;
  res.depth = depth;
  return res;
}

Move Engine::choose_move(Board& b) {
  const SearchResult r = search(b);
  if (reporter_) reporter_(r.best);
  return r.best;
}

} // namespace loa
