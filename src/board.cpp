#include "loa/board.hpp"
#include "loa/regions.hpp"


namespace loa {


const Layout& initial_layout() {
static const Layout L = [] {
  constexpr Piece E = Piece::Empty, W = Piece::White, B = Piece::Black;
  Layout l{};
  l[0] = {E, B, B, B, B, B, B, E};
  for (int r = 1; r <= 6; ++r) l[static_cast<std::size_t>(r)] = {W, E, E, E, E, E, E, W};
  l[7] = {E, B, B, B, B, B, B, E};
  return l;
}();
return L;
}


Board::Board() { clear(); }


Board::Board(const Layout& contents, Piece turn) { initialize(contents, turn); }


void Board::clear() {
move_limit_ = 2 * DEFAULT_MOVE_LIMIT;
initialize(initial_layout(), Piece::Black);
}


void Board::initialize(const Layout& contents, Piece turn) {
for (int r = 0; r < BOARD_SIZE; ++r)
for (int f = 0; f < BOARD_SIZE; ++f)
grid_[static_cast<std::size_t>(make_square(f, r))] =
    contents[static_cast<std::size_t>(r)][static_cast<std::size_t>(f)];
stm_ = turn;
history_.clear();
invalidate_();
recompute_hash_();
}


void Board::set(Square s, Piece p) {
put_piece_(s, p);
}


void Board::set_side_to_move(Piece side) {
stm_ = side;
invalidate_();
recompute_hash_();
}


void Board::set_move_limit(int limit) {
move_limit_ = 2 * limit;
winner_known_ = false;
}


void Board::put_piece_(Square s, Piece p) {
grid_[static_cast<std::size_t>(s)] = p;
invalidate_();
recompute_hash_();
}


int Board::piece_count(Piece side) const {
int n = 0;
for (Piece p : grid_) if (p == side) ++n;
return n;
}


const std::vector<int>& Board::region_sizes(Piece side) const {
if (!regions_valid_) {
  regions_[0] = compute_regions(*this, Piece::White);
  regions_[1] = compute_regions(*this, Piece::Black);
  regions_valid_ = true;
}
return regions_[side == Piece::White ? 0 : 1];
}


// The side that just moved is checked first: a move that connects both
// sides is a win for the mover.
Winner Board::winner() const {
if (!winner_known_) {
  const Piece mover = opposite(stm_);
  if (pieces_contiguous(mover)) {
    winner_ = winner_of(mover);
  } else if (pieces_contiguous(stm_)) {
    winner_ = winner_of(stm_);
  } else if (moves_made() >= move_limit_) {
    winner_ = Winner::Draw;
  } else {
    winner_ = Winner::Unknown;
  }
  winner_known_ = true;
}
return winner_;
}


bool Board::operator==(const Board& o) const {
if (grid_ != o.grid_ || stm_ != o.stm_) return false;
if (history_.size() != o.history_.size()) return false;
for (std::size_t i = 0; i < history_.size(); ++i) {
  if (!same_move(history_[i], o.history_[i])) return false;
  if (history_[i].capture != o.history_[i].capture) return false;
}
return true;
}


void Board::invalidate_() {
regions_valid_ = false;
winner_known_ = false;
}


void Board::recompute_hash_() {
const auto& Z = Zobrist::instance();
U64 h = 0ULL;
for (int s = 0; s < SQUARE_N; ++s) {
  const Piece p = grid_[static_cast<std::size_t>(s)];
  if (p == Piece::Empty) continue;
  h ^= Z.piece_on[static_cast<std::size_t>(p)][static_cast<std::size_t>(s)];
}
if (stm_ == Piece::Black) h ^= Z.side_to_move;
hash_ = h;
}


} // namespace loa
