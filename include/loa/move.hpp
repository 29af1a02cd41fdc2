#pragma once
#include <cstdint>
#include "loa/types.hpp"


namespace loa {


struct Move {
Square from{0};
Square to{0};
bool capture{false};
int score{0}; // annotation set by the search; not part of move identity
};


inline bool same_move(const Move& a, const Move& b) {
  return a.from == b.from && a.to == b.to;
}

inline bool is_null_move(const Move& m) { return m.from == m.to; }


} // namespace loa
