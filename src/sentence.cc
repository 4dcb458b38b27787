#include "sentence.h"

#include <sstream>
#include <utility>

#include "absl/algorithm/container.h"
#include "absl/strings/str_cat.h"

#include "minesweeper.h"

Sentence::Sentence(CellSet cells, int count) : cells_(std::move(cells)), count_(count) {
  if (count_ < 0 || count_ > size()) {
    std::ostringstream ss;
    ss << *this;
    throw Contradiction(absl::StrCat("Sentence count out of range: ", ss.str()));
  }
}

bool Sentence::is_subset_of(const Sentence& o) const {
  if (size() > o.size()) {
    return false;
  }
  return absl::c_all_of(cells_, [&o](Cell c) { return o.contains(c); });
}

CellSet Sentence::known_mines() const {
  if (count_ == size() && count_ != 0) {
    return cells_;
  }
  return {};
}

CellSet Sentence::known_safes() const {
  if (count_ == 0) {
    return cells_;
  }
  return {};
}

void Sentence::discard_as_mine(Cell c) {
  if (cells_.erase(c) == 0) {
    return;
  }
  if (count_ == 0) {
    // The cell was proven safe by this sentence.
    cells_.insert(c);
    std::ostringstream ss;
    ss << c << " is a mine, but " << *this;
    throw Contradiction(ss.str());
  }
  count_ -= 1;
}

void Sentence::discard_as_safe(Cell c) {
  if (cells_.erase(c) == 0) {
    return;
  }
  if (count_ > size()) {
    // The cell was proven a mine by this sentence.
    cells_.insert(c);
    std::ostringstream ss;
    ss << c << " is safe, but " << *this;
    throw Contradiction(ss.str());
  }
}

std::ostream& operator<< (std::ostream& stream, const Sentence& s) {
  return stream << s.cells() << " = " << s.count();
}
