#pragma once
#include <cstdint>


namespace loa {


using U64 = std::uint64_t;
using Square = int; // 0..63, a1 = 0, h8 = 63


enum class Piece : int { White = 0, Black = 1, Empty = 2 };


// Result of a position: Unknown = game still in progress.
enum class Winner : int { Unknown = 0, White = 1, Black = 2, Draw = 3 };


constexpr int COLOR_N = 2;
constexpr int BOARD_SIZE = 8;
constexpr int SQUARE_N = 64;


inline constexpr int file_of(Square s) { return s & 7; }
inline constexpr int rank_of(Square s) { return s >> 3; }
inline constexpr Square make_square(int file, int rank) { return rank * 8 + file; }
inline constexpr bool on_board(int file, int rank) {
  return file >= 0 && file < BOARD_SIZE && rank >= 0 && rank < BOARD_SIZE;
}


// Empty stays Empty.
inline constexpr Piece opposite(Piece p) {
  return p == Piece::White ? Piece::Black : (p == Piece::Black ? Piece::White : Piece::Empty);
}


inline constexpr Winner winner_of(Piece p) {
  return p == Piece::White ? Winner::White : (p == Piece::Black ? Winner::Black : Winner::Unknown);
}


} // namespace loa
