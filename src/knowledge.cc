#include "knowledge.h"

#include <sstream>
#include <utility>

#include "absl/algorithm/container.h"
#include "absl/strings/str_format.h"

#include "minesweeper.h"
#include "sentence.h"

KnowledgeBase::KnowledgeBase(Dims dims) : dims_(dims) {
  if (dims_.height <= 0 || dims_.width <= 0) {
    throw std::invalid_argument(
        absl::StrFormat("Invalid board size: %dx%d", dims_.height, dims_.width));
  }
}

void KnowledgeBase::reset() {
  moves_made_.clear();
  safes_.clear();
  mines_.clear();
  sentences_.clear();
}

int KnowledgeBase::remove_known(CellSet& cells, int count) const {
  for (auto it = cells.begin(); it != cells.end();) {
    if (mines_.contains(*it)) {
      count -= 1;
      cells.erase(it++);
    } else if (safes_.contains(*it)) {
      cells.erase(it++);
    } else {
      ++it;
    }
  }
  return count;
}

void KnowledgeBase::observe(Cell cell, int count) {
  if (!dims_.contains(cell)) {
    throw InvalidMove(absl::StrFormat("Cell {%d, %d} is outside the %dx%d board",
                                      cell.row, cell.col, dims_.height, dims_.width));
  }
  if (moves_made_.contains(cell)) {
    throw InvalidMove(absl::StrFormat("Cell {%d, %d} was already revealed", cell.row, cell.col));
  }

  Neighbors neighbors(cell, dims_);
  if (count < 0 || count > neighbors.size()) {
    throw Contradiction(absl::StrFormat("Cell {%d, %d} has %d neighbors, can't have %d mines",
                                        cell.row, cell.col, neighbors.size(), count));
  }

  // The cell itself is never one of its neighbors, so this is unaffected by
  // declaring it safe below.
  CellSet unknown(neighbors.begin(), neighbors.end());
  int mines_left = remove_known(unknown, count);
  if (mines_left < 0 || mines_left > int(unknown.size())) {
    throw Contradiction(absl::StrFormat(
        "Cell {%d, %d} reports %d mines, but %d of its neighbors are known mines and %d are unknown",
        cell.row, cell.col, count, count - mines_left, unknown.size()));
  }

  declare_safe(cell);  // Throws before changing anything if it's a known mine.
  moves_made_.insert(cell);
  if (!unknown.empty()) {
    sentences_.emplace_back(std::move(unknown), mines_left);
  }
  infer();
}

void KnowledgeBase::add_sentence(CellSet cells, int count) {
  for (Cell c : cells) {
    if (!dims_.contains(c)) {
      throw InvalidMove(absl::StrFormat("Cell {%d, %d} is outside the %dx%d board",
                                        c.row, c.col, dims_.height, dims_.width));
    }
  }
  int mines_left = remove_known(cells, count);
  Sentence sentence(std::move(cells), mines_left);  // Throws if the count doesn't fit.
  if (!sentence.empty()) {
    sentences_.push_back(std::move(sentence));
  }
  infer();
}

void KnowledgeBase::declare_safe(Cell cell) {
  if (mines_.contains(cell)) {
    throw Contradiction(absl::StrFormat("Cell {%d, %d} is a known mine, can't be safe",
                                        cell.row, cell.col));
  }
  for (const Sentence& s : sentences_) {
    if (s.contains(cell) && s.count() == s.size()) {
      std::ostringstream ss;
      ss << "Cell " << cell << " can't be safe, given " << s;
      throw Contradiction(ss.str());
    }
  }

  safes_.insert(cell);
  for (Sentence& s : sentences_) {
    s.discard_as_safe(cell);
  }
}

void KnowledgeBase::declare_mine(Cell cell) {
  if (safes_.contains(cell)) {
    throw Contradiction(absl::StrFormat("Cell {%d, %d} is known safe, can't be a mine",
                                        cell.row, cell.col));
  }
  for (const Sentence& s : sentences_) {
    if (s.contains(cell) && s.count() == 0) {
      std::ostringstream ss;
      ss << "Cell " << cell << " can't be a mine, given " << s;
      throw Contradiction(ss.str());
    }
  }

  mines_.insert(cell);
  for (Sentence& s : sentences_) {
    s.discard_as_mine(cell);
  }
}

bool KnowledgeBase::infer() {
  bool learned = false;
  while (infer_pass()) {
    learned = true;
  }
  return learned;
}

bool KnowledgeBase::infer_pass() {
  bool learned = false;

  // Cells that some sentence fully determines.
  CellSet safes;
  CellSet mines;
  for (const Sentence& s : sentences_) {
    CellSet ks = s.known_safes();
    safes.insert(ks.begin(), ks.end());
    CellSet km = s.known_mines();
    mines.insert(km.begin(), km.end());
  }
  for (Cell c : safes) {
    if (!safes_.contains(c)) {
      declare_safe(c);
      learned = true;
    }
  }
  for (Cell c : mines) {
    if (!mines_.contains(c)) {
      declare_mine(c);
      learned = true;
    }
  }

  // If a ⊆ b, the mines in b that aren't in a number b.count - a.count.
  // New sentences are only compared with each other on the next pass.
  std::vector<Sentence> derived;
  for (size_t i = 0; i < sentences_.size(); ++i) {
    const Sentence& a = sentences_[i];
    if (a.empty()) {
      continue;
    }
    for (size_t j = 0; j < sentences_.size(); ++j) {
      const Sentence& b = sentences_[j];
      if (i == j || !a.is_subset_of(b)) {
        continue;
      }
      CellSet rest;
      for (Cell c : b.cells()) {
        if (!a.contains(c)) {
          rest.insert(c);
        }
      }
      if (rest.empty()) {
        if (a.count() != b.count()) {
          std::ostringstream ss;
          ss << "Same cells, different counts: " << a << " and " << b;
          throw Contradiction(ss.str());
        }
        continue;
      }
      Sentence s(std::move(rest), b.count() - a.count());
      if (!absl::c_linear_search(sentences_, s) && !absl::c_linear_search(derived, s)) {
        derived.push_back(std::move(s));
      }
    }
  }
  if (!derived.empty()) {
    learned = true;
    for (Sentence& s : derived) {
      sentences_.push_back(std::move(s));
    }
  }

  prune();
  return learned;
}

void KnowledgeBase::prune() {
  std::vector<Sentence> kept;
  kept.reserve(sentences_.size());
  for (Sentence& s : sentences_) {
    if (!s.empty() && !absl::c_linear_search(kept, s)) {
      kept.push_back(std::move(s));
    }
  }
  sentences_ = std::move(kept);
}

std::ostream& operator<<(std::ostream& stream, const KnowledgeBase& kb) {
  stream << "moves: " << kb.moves_made() << "\n";
  stream << "safes: " << kb.safes() << "\n";
  stream << "mines: " << kb.mines() << "\n";
  stream << "sentences:\n";
  for (const Sentence& s : kb.sentences()) {
    stream << "  " << s << "\n";
  }
  return stream;
}
