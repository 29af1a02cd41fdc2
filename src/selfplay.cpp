#include "loa/selfplay.hpp"

#include <chrono>
#include <iostream>

#include "loa/move_do.hpp"
#include "loa/movegen.hpp"

namespace loa {

const char* outcome_name(GameOutcome o) {
  switch (o) {
    case GameOutcome::WhiteWin: return "white";
    case GameOutcome::BlackWin: return "black";
    case GameOutcome::Draw:     return "draw";
    case GameOutcome::Aborted:  return "aborted";
  }
  return "aborted";
}

GameReport selfplay_game(Board start, const SearchLimits& lim, int maxPlies,
                         RandomSource& rng, const MoveReporter& report) {
  using clock = std::chrono::steady_clock;

  GameReport rep;
  Board b = start;

  Engine engine(rng, lim);
  engine.set_reporter(report);

  const auto t0 = clock::now();

  for (int ply = 0; ply < maxPlies; ++ply) {
    // Connection or move limit.
    const Winner w = b.winner();
    if (w != Winner::Unknown) {
      rep.plies = ply;
      switch (w) {
        case Winner::White: rep.outcome = GameOutcome::WhiteWin; rep.reason = "white connected"; break;
        case Winner::Black: rep.outcome = GameOutcome::BlackWin; rep.reason = "black connected"; break;
        default:            rep.outcome = GameOutcome::Draw;     rep.reason = "move limit reached"; break;
      }
      break;
    }

    MoveList ml;
    generate_legal(b, ml);
    if (ml.empty()) {
      rep.outcome = GameOutcome::Aborted;
      rep.plies = ply;
      rep.reason = "side to move has no legal move";
      break;
    }

    const Move best = engine.choose_move(b);
    rep.nodes += engine.nodes();

    make_move(b, best);
    rep.moves.push_back(b.history().back());
    rep.plies = ply + 1;
  }

  if (rep.reason.empty()) {
    const Winner w = b.winner();
    if (w == Winner::White)      { rep.outcome = GameOutcome::WhiteWin; rep.reason = "white connected"; }
    else if (w == Winner::Black) { rep.outcome = GameOutcome::BlackWin; rep.reason = "black connected"; }
    else if (w == Winner::Draw)  { rep.outcome = GameOutcome::Draw;     rep.reason = "move limit reached"; }
    else                         { rep.outcome = GameOutcome::Aborted;  rep.reason = "max plies reached"; }
  }

  const auto t1 = clock::now();
  rep.seconds = std::chrono::duration<double>(t1 - t0).count();

  return rep;
}

SelfPlaySummary selfplay_many(const Board& start, const SelfPlayConfig& cfg) {
  SelfPlaySummary sum;
  sum.games = cfg.games;

  for (int i = 0; i < cfg.games; ++i) {
    SeededRandom rng(cfg.seed + static_cast<std::uint64_t>(i));
    GameReport rep = selfplay_game(start, cfg.limits, cfg.maxPlies, rng);

    sum.nodes += rep.nodes;
    sum.seconds += rep.seconds;

    switch (rep.outcome) {
      case GameOutcome::WhiteWin: ++sum.whiteWins; break;
      case GameOutcome::BlackWin: ++sum.blackWins; break;
      case GameOutcome::Draw:     ++sum.draws;     break;
      case GameOutcome::Aborted:  ++sum.aborted;   break;
    }

    if (cfg.printPerGame) {
      std::cout << "game " << (i + 1) << " result " << outcome_name(rep.outcome)
                << " plies " << rep.plies
                << " nodes " << rep.nodes
                << " (" << rep.reason << ")\n";
    }
  }

  return sum;
}

} // namespace loa
