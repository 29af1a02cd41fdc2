#pragma once
#include <array>
#include <cstdint>
#include <vector>
#include "loa/move.hpp"
#include "loa/types.hpp"
#include "loa/zobrist.hpp"


namespace loa {


// Moves per side before the game is drawn.
constexpr int DEFAULT_MOVE_LIMIT = 60;


// Rows are given bottom (rank 1) first: layout[rank][file].
using Layout = std::array<std::array<Piece, BOARD_SIZE>, BOARD_SIZE>;

// Standard starting layout: Black on b1..g1 and b8..g8, White on a2..a7 and h2..h7.
const Layout& initial_layout();


class Board {
public:
// Standard initial position, Black to move.
Board();
Board(const Layout& contents, Piece turn);

// Back to the standard initial position; move limit reset to default.
void clear();
void initialize(const Layout& contents, Piece turn);

Piece get(Square s) const { return grid_[static_cast<std::size_t>(s)]; }
// Editing a square drops the cached analysis. Not recorded in history.
void set(Square s, Piece p);

void set_side_to_move(Piece side);
Piece side_to_move() const { return stm_; }

// `limit` is in moves per side; stored as plies.
void set_move_limit(int limit);
int move_limit() const { return move_limit_; }

int moves_made() const { return static_cast<int>(history_.size()); }
const std::vector<Move>& history() const { return history_; }

int piece_count(Piece side) const;

// Sizes of the 8-connected groups of `side`, largest first.
const std::vector<int>& region_sizes(Piece side) const;
bool pieces_contiguous(Piece side) const { return region_sizes(side).size() == 1; }

Winner winner() const;
bool game_over() const { return winner() != Winner::Unknown; }

U64 hash() const { return hash_; }

// Same grid, side to move and move history.
bool operator==(const Board& o) const;
bool operator!=(const Board& o) const { return !(*this == o); }

// Low-level primitives for make_move/retract (move_do.cpp).
void put_piece_(Square s, Piece p);
void push_history_(const Move& m) { history_.push_back(m); winner_known_ = false; }
void pop_history_() { history_.pop_back(); winner_known_ = false; }

private:
std::array<Piece, SQUARE_N> grid_{};
Piece stm_ = Piece::Black;
std::vector<Move> history_;
int move_limit_ = 2 * DEFAULT_MOVE_LIMIT; // plies
U64 hash_ = 0ULL;

// Derived, recomputed lazily after any grid change
mutable bool regions_valid_ = false;
mutable std::array<std::vector<int>, COLOR_N> regions_{};
mutable bool winner_known_ = false;
mutable Winner winner_ = Winner::Unknown;

void invalidate_();
void recompute_hash_();
};


} // namespace loa
