#pragma once

#include <ostream>
#include <utility>

#include "absl/container/flat_hash_set.h"

struct Cell {
  int row, col;

  Cell() : row(0), col(0) {}
  Cell(int row_, int col_) : row(row_), col(col_) {}

  bool operator==(const Cell& o) const { return row == o.row && col == o.col; };
  bool operator!=(const Cell& o) const { return !(*this == o); };
  bool operator<(const Cell& o) const { return row != o.row ? row < o.row : col < o.col; };

  template <typename H>
  friend H AbslHashValue(H h, const Cell& c) {
    return H::combine(std::move(h), c.row, c.col);
  }
};

std::ostream& operator<< (std::ostream& stream, const Cell& c);


struct Dims {
  int height, width;

  Dims() : height(0), width(0) {}
  Dims(int height_, int width_) : height(height_), width(width_) {}

  int size() const { return height * width; }
  bool contains(const Cell& c) const {
    return 0 <= c.row && c.row < height && 0 <= c.col && c.col < width;
  }

  bool operator==(const Dims& o) const { return height == o.height && width == o.width; };
  bool operator!=(const Dims& o) const { return !(*this == o); };
};


using CellSet = absl::flat_hash_set<Cell>;

// Prints in (row, col) order so the output doesn't depend on hashing.
std::ostream& operator<< (std::ostream& stream, const CellSet& cells);
