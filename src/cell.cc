#include "cell.h"

#include <vector>

#include "absl/algorithm/container.h"

std::ostream& operator<< (std::ostream& stream, const Cell& c) {
  return stream << "{" << c.row << ", " << c.col << "}";
}

std::ostream& operator<< (std::ostream& stream, const CellSet& cells) {
  std::vector<Cell> sorted(cells.begin(), cells.end());
  absl::c_sort(sorted);
  stream << "{";
  for (size_t i = 0; i < sorted.size(); ++i) {
    if (i > 0) {
      stream << ", ";
    }
    stream << sorted[i];
  }
  return stream << "}";
}
