#pragma once

#include <cstdint>
#include <ostream>

#include "cell.h"
#include "minesweeper.h"

// The ground truth of one game. The agent never sees this directly, only the
// counts the driver passes on from adjacent_mine_count().
class Board {
 public:
  // Places exactly `mines` mines uniformly at random.
  Board(Dims dims, int mines, uint64_t seed = 0);
  // A fixed layout.
  Board(Dims dims, const CellSet& mines);

  Dims dims() const { return dims_; }
  const CellSet& mines() const { return mines_; }
  int mine_count() const { return mines_.size(); }

  bool is_mine(Cell c) const;
  // The number of mines around a cell that isn't a mine.
  int adjacent_mine_count(Cell c) const;
  // Won once exactly the mines are flagged.
  bool all_mines_flagged(const CellSet& flagged) const { return flagged == mines_; }

  void validate() const;

 private:
  void check_bounds(Cell c) const;

  Dims dims_;
  Array2D<uint8_t> grid_;
  CellSet mines_;
};

std::ostream& operator<<(std::ostream& stream, const Board& board);
