#include <cassert>
#include <iostream>

#include "loa/board.hpp"
#include "loa/eval.hpp"
#include "loa/notation.hpp"
#include "loa/random.hpp"

int main() {
  using namespace loa;

  FixedRandom low(0);                     // lowest entry of every band, momentum half bonus
  const EvalParams still{false};          // no momentum

  // 1) Decided games score the winning magnitude whatever side is scored; draws are 0.
  {
    Evaluator ev(low, still);
    Board w;
    set_from_text(w, "8/8/8/8/8/8/8/ww4bb b");
    assert(ev.evaluate(w, 1) == WINNING_VALUE);
    assert(ev.evaluate(w, -1) == WINNING_VALUE);

    Board bl;
    set_from_text(bl, "8/8/8/8/8/8/8/ww4bb w");
    assert(ev.evaluate(bl, 1) == -WINNING_VALUE);
    assert(terminal_score(bl) == -WINNING_VALUE);

    Board d;
    set_from_text(d, "8/8/8/8/8/8/8/w1w2b1b w");
    d.set_move_limit(0);
    assert(d.winner() == Winner::Draw);
    assert(ev.evaluate(d, 1) == 0);
    assert(ev.evaluate(d, -1) == 0);
  }

  // 2) Start position: every piece sits on its home edge.
  //    12 * -100, plus the two-region nudge (20).
  {
    Evaluator ev(low, still);
    Board b;
    assert(ev.evaluate(b, 1) == -1180);
    assert(ev.evaluate(b, -1) == 1180);   // Black's score is mirrored in sign
  }

  // 3) Hand-scored position.
  //    White: h8 -100, f6 1+20, e5 1+20+90, a1 -100, b1 1, c1 1+20 => -46; regions {3,2,1} add nothing.
  //    Black: a8 -100, h1 -100; regions {1,1}: largest under 40% -100, two regions +20 => -280.
  {
    Evaluator ev(low, still);
    Board b;
    set_from_text(b, "b6w/8/5w2/4w3/8/8/8/www4b w");
    assert(ev.evaluate(b, 1) == -46);
    assert(ev.evaluate(b, -1) == 280);
  }

  // 4) Top of every band.
  //    White: h8 -100, f6 5+40, e5 5+40+110, a1 -100, b1 5, c1 5+40 => 50.
  {
    FixedRandom high(9);
    Evaluator ev(high, still);
    Board b;
    set_from_text(b, "b6w/8/5w2/4w3/8/8/8/www4b w");
    assert(ev.evaluate(b, 1) == 50);
  }

  // 5) Momentum: an improvement on the previous score earns MEDIUM / 2 with rand < 5.
  {
    Evaluator ev(low);
    Board start;
    Board mid;
    set_from_text(mid, "b6w/8/5w2/4w3/8/8/8/www4b w");

    assert(!ev.has_last());
    assert(ev.evaluate(start, 1) == -1180);          // nothing to compare against
    assert(ev.last() == -1180);
    assert(ev.evaluate(mid, 1) == -46 + MEDIUM / 2); // better for White
    assert(ev.evaluate(mid, 1) == -46);              // not better than -21
    assert(ev.evaluate(start, 1) == -1180);          // worse: no bonus

    ev.reset();
    assert(!ev.has_last());
    assert(ev.evaluate(mid, 1) == -46);

    // For Black, better means lower.
    ev.reset();
    assert(ev.evaluate(start, -1) == 1180);
    assert(ev.evaluate(mid, -1) == 280 - MEDIUM / 2);

    // rand >= 5 gives the full bonus
    FixedRandom high(7);
    Evaluator ev2(high);
    (void)ev2.evaluate(start, 1);
    // White with top bands on `mid` is 50; that beats start's score
    assert(ev2.evaluate(mid, 1) == 50 + MEDIUM);
  }

  // 6) Terminal scores leave the momentum cell alone.
  {
    Evaluator ev(low);
    Board w;
    set_from_text(w, "8/8/8/8/8/8/8/ww4bb b");
    assert(ev.evaluate(w, 1) == WINNING_VALUE);
    assert(!ev.has_last());
  }

  // 7) Dispersion metric
  {
    Board b;
    set_from_text(b, "8/8/8/8/8/8/8/w1w5 w");
    assert(average_distance(b, Piece::White) == 2);
    assert(average_distance(b, Piece::Black) == 0);
    Board one;
    set_from_text(one, "8/8/8/8/8/8/8/w7 w");
    assert(average_distance(one, Piece::White) == 0);
  }

  // 8) Same seed, same numbers.
  {
    SeededRandom r1(42), r2(42);
    for (int i = 0; i < 100; ++i) {
      const int a = r1.rand_int(5);
      assert(a >= 0 && a < 5);
      assert(a == r2.rand_int(5));
    }
    assert(r1.rand_int(1) == 0);
  }

  std::cout << "eval_sanity_smoke ok\n";
  return 0;
}
