#pragma once
#include <array>
#include <cstddef>
#include "loa/move.hpp"


namespace loa {


// At most 8 moves per piece. Edited boards may exceed 12 pieces per side;
// the widest positions seen reach 108 legal moves, under CAP.
struct MoveList {
static constexpr std::size_t CAP = 128;
std::array<Move, CAP> data{};
std::size_t sz = 0;


void push(const Move& m) { if (sz < CAP) data[sz++] = m; }
void clear() { sz = 0; }
Move* begin() { return data.data(); }
Move* end() { return data.data() + sz; }
const Move* begin() const { return data.data(); }
const Move* end() const { return data.data() + sz; }
const Move& operator[](std::size_t i) const { return data[i]; }
std::size_t size() const { return sz; }
bool empty() const { return sz == 0; }
};


} // namespace loa
