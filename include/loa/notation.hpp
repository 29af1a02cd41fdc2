#pragma once
#include <string>
#include <string_view>
#include <stdexcept>
#include "loa/board.hpp"
#include "loa/move.hpp"

namespace loa {

struct NotationError : std::runtime_error { using std::runtime_error::runtime_error; };

// Ranks 8..1 separated by '/', then side to move, then optional move limit per side.
// 'b' black, 'w' white, '-' or a digit run for empty squares.
inline constexpr char STARTPOS[] =
  "1bbbbbb1/w6w/w6w/w6w/w6w/w6w/w6w/1bbbbbb1 b";

// Replaces the whole board state (history cleared). Throws NotationError.
void set_from_text(Board& b, std::string_view text);
std::string to_text(const Board& b);

// "a1".."h8". parse_square throws std::invalid_argument.
std::string square_name(Square s);
Square parse_square(std::string_view s);

// "b1-b3", or "c1xa3" for a capture
std::string move_to_string(const Move& m);

// Accepts "b1-b3", "b1xb3" or "b1b3"; returns the matching legal move.
// Throws std::invalid_argument if malformed or not legal on `b`.
Move string_to_move(const Board& b, const std::string& s);

// Multi-line board picture, rank 8 on top.
std::string to_diagram(const Board& b);

} // namespace loa
