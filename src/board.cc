#include "board.h"

#include <stdexcept>

#include "absl/random/random.h"
#include "absl/strings/str_format.h"

#include "minesweeper.h"
#include "random.h"

namespace {

Dims checked(Dims dims) {
  if (dims.height <= 0 || dims.width <= 0) {
    throw std::invalid_argument(
        absl::StrFormat("Invalid board size: %dx%d", dims.height, dims.width));
  }
  return dims;
}

}  // namespace

Board::Board(Dims dims, int mines, uint64_t seed) : dims_(checked(dims)), grid_(dims_) {
  if (mines < 0 || mines > dims_.size()) {
    throw std::invalid_argument(
        absl::StrFormat("Can't place %d mines on a %dx%d board", mines, dims_.height, dims_.width));
  }

  Xoshiro256pp bitgen(seed);
  grid_.fill(0);
  while (int(mines_.size()) < mines) {
    Cell c(absl::Uniform(bitgen, 0, dims_.height), absl::Uniform(bitgen, 0, dims_.width));
    if (!grid_[c]) {
      grid_[c] = 1;
      mines_.insert(c);
    }
  }
}

Board::Board(Dims dims, const CellSet& mines) : dims_(checked(dims)), grid_(dims_) {
  grid_.fill(0);
  for (Cell c : mines) {
    check_bounds(c);
    grid_[c] = 1;
    mines_.insert(c);
  }
}

void Board::check_bounds(Cell c) const {
  if (!dims_.contains(c)) {
    throw InvalidMove(absl::StrFormat("Cell {%d, %d} is outside the %dx%d board",
                                      c.row, c.col, dims_.height, dims_.width));
  }
}

bool Board::is_mine(Cell c) const {
  check_bounds(c);
  return grid_[c];
}

int Board::adjacent_mine_count(Cell c) const {
  if (is_mine(c)) {
    throw InvalidMove(absl::StrFormat("Cell {%d, %d} is a mine", c.row, c.col));
  }
  int count = 0;
  for (Cell n : Neighbors(c, dims_)) {
    count += grid_[n];
  }
  return count;
}


std::ostream& operator<<(std::ostream& stream, const Board& board) {
  Dims dims = board.dims();
  for (int r = 0; r < dims.height; ++r) {
    for (int c = 0; c < dims.width; ++c) {
      stream << "--";
    }
    stream << "-\n";
    for (int c = 0; c < dims.width; ++c) {
      stream << (board.is_mine({r, c}) ? "|X" : "| ");
    }
    stream << "|\n";
  }
  for (int c = 0; c < dims.width; ++c) {
    stream << "--";
  }
  return stream << "-\n";
}
