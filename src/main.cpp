#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <cstdint>
#include <exception>

#include "loa/types.hpp"
#include "loa/board.hpp"
#include "loa/notation.hpp"
#include "loa/perft.hpp"
#include "loa/eval.hpp"
#include "loa/random.hpp"
#include "loa/search.hpp"
#include "loa/selfplay.hpp"

using namespace loa;

static void usage() {
  std::cout <<
    "LOA CLI\n"
    "Usage:\n"
    "  loa_cli perft <depth> [position...]\n"
    "  loa_cli divide <depth> [position...]\n"
    "  loa_cli eval [position...]\n"
    "  loa_cli search [depth <N>] [seed <N>] [noprune] [nodispersion] [nomomentum]\n"
    "                 [position <TEXT...>]\n"
    "  loa_cli selfplay [games <N>] [depth <N>] [plies <N>] [seed <N>] [limit <N>] [quiet]\n"
    "If position omitted, uses the standard start (black to move).\n";
}

static std::string join_from(const std::vector<std::string>& a, size_t i) {
  if (i >= a.size()) return "";
  std::ostringstream oss;
  for (size_t k = i; k < a.size(); ++k) {
    if (k > i) oss << ' ';
    oss << a[k];
  }
  return oss.str();
}

static Board board_from_args(const std::vector<std::string>& a, size_t posStart) {
  Board b;
  if (posStart < a.size()) {
    set_from_text(b, join_from(a, posStart));
  }
  return b;
}

static int to_int(const std::string& s) {
  return std::stoi(s);
}

static std::uint64_t to_u64(const std::string& s) {
  return static_cast<std::uint64_t>(std::stoull(s));
}

static int run(const std::vector<std::string>& args) {
  const std::string cmd = args[0];

  // perft <depth> [position...]
  if (cmd == "perft") {
    if (args.size() < 2) { usage(); return 1; }
    const int depth = to_int(args[1]);
    Board b = board_from_args(args, 2);
    std::cout << perft(b, depth) << "\n";
    return 0;
  }

  // divide <depth> [position...]
  if (cmd == "divide") {
    if (args.size() < 2) { usage(); return 1; }
    const int depth = to_int(args[1]);
    Board b = board_from_args(args, 2);
    std::vector<std::pair<Move, std::uint64_t>> parts;
    perft_divide(b, depth, parts);
    std::uint64_t total = 0;
    for (auto& [m, n] : parts) {
      std::cout << move_to_string(m) << " " << n << "\n";
      total += n;
    }
    std::cout << "total " << total << "\n";
    return 0;
  }

  // eval [position...]
  if (cmd == "eval") {
    Board b = board_from_args(args, 1);
    FixedRandom rng(0);
    Evaluator ev(rng, EvalParams{false});
    std::cout << to_diagram(b) << "\n";
    std::cout << "eval white " << ev.evaluate(b, 1)
              << " black " << ev.evaluate(b, -1)
              << " regions " << b.region_sizes(Piece::White).size()
              << "/" << b.region_sizes(Piece::Black).size() << "\n";
    return 0;
  }

  // search [depth <N>] [seed <N>] [noprune] ... [position <TEXT...>]
  if (cmd == "search") {
    SearchLimits lim{};
    std::uint64_t seed = 1;
    size_t posStart = args.size();

    for (size_t i = 1; i < args.size(); ++i) {
      const std::string& tok = args[i];

      if (tok == "position")     { posStart = i + 1; break; }
      if (tok == "noprune")      { lim.prune = false; continue; }
      if (tok == "nodispersion") { lim.dispersion_bonus = false; continue; }
      if (tok == "nomomentum")   { lim.eval.momentum = false; continue; }
      if (i + 1 >= args.size()) break;

      const std::string& val = args[i + 1];

      if (tok == "depth") { lim.depth = to_int(val); ++i; continue; }
      if (tok == "seed")  { seed = to_u64(val); ++i; continue; }
    }

    Board b = board_from_args(args, posStart);
    SeededRandom rng(seed);
    Engine engine(rng, lim);
    auto r = engine.search(b);

    std::cout << "best " << move_to_string(r.best)
              << " score " << r.score
              << " nodes " << r.nodes
              << " pv ";
    for (auto& m : r.pv) std::cout << move_to_string(m) << ' ';
    std::cout << "\n";
    return 0;
  }

  // selfplay [games <N>] [depth <N>] [plies <N>] [seed <N>] [limit <N>] [quiet]
  if (cmd == "selfplay") {
    SelfPlayConfig cfg{};
    int limit = DEFAULT_MOVE_LIMIT;

    for (size_t i = 1; i < args.size(); ++i) {
      const std::string& tok = args[i];
      if (tok == "quiet") { cfg.printPerGame = false; continue; }
      if (i + 1 >= args.size()) break;

      const std::string& val = args[i + 1];

      if (tok == "games") { cfg.games = to_int(val); ++i; continue; }
      if (tok == "depth") { cfg.limits.depth = to_int(val); ++i; continue; }
      if (tok == "plies") { cfg.maxPlies = to_int(val); ++i; continue; }
      if (tok == "seed")  { cfg.seed = to_u64(val); ++i; continue; }
      if (tok == "limit") { limit = to_int(val); ++i; continue; }
    }

    Board b;
    b.set_move_limit(limit);
    const SelfPlaySummary s = selfplay_many(b, cfg);

    std::cout << "games " << s.games
              << " white " << s.whiteWins
              << " black " << s.blackWins
              << " draws " << s.draws
              << " aborted " << s.aborted
              << " nodes " << s.nodes
              << " seconds " << s.seconds << "\n";
    return 0;
  }

  usage();
  return 0;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  if (args.empty()) { usage(); return 0; }

  try {
    return run(args);
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}
