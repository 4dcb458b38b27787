#pragma once

#include <ostream>

#include "cell.h"

// A constraint: exactly count() of cells() are mines.
class Sentence {
 public:
  // Throws Contradiction unless 0 <= count <= cells.size().
  Sentence(CellSet cells, int count);

  const CellSet& cells() const { return cells_; }
  int count() const { return count_; }
  int size() const { return cells_.size(); }
  bool empty() const { return cells_.empty(); }
  bool contains(Cell c) const { return cells_.contains(c); }
  bool is_subset_of(const Sentence& o) const;

  // Every cell is a mine. Empty when that can't be concluded, including for a
  // sentence with no cells.
  CellSet known_mines() const;
  // Every cell is safe. Empty when that can't be concluded.
  CellSet known_safes() const;

  // `c` is known to be a mine, so stop tracking it. No-op if not in cells().
  void discard_as_mine(Cell c);
  // `c` is known to be safe, so stop tracking it. No-op if not in cells().
  void discard_as_safe(Cell c);

  bool operator==(const Sentence& o) const { return count_ == o.count_ && cells_ == o.cells_; }
  bool operator!=(const Sentence& o) const { return !(*this == o); }

 private:
  CellSet cells_;
  int count_;
};

std::ostream& operator<< (std::ostream& stream, const Sentence& s);
