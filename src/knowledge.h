#pragma once

#include <ostream>
#include <vector>

#include "cell.h"
#include "minesweeper.h"
#include "sentence.h"

// Everything the agent has learned about one game: the cells it revealed, the
// cells proven safe or proven to be mines, and the sentences still carrying
// information about the rest.
//
// safes() and mines() only ever grow and are always disjoint. Anything that
// would violate that throws Contradiction.
class KnowledgeBase {
 public:
  KnowledgeBase(Dims dims);

  // Forget everything, ready for a new game on the same board size.
  void reset();

  // `cell` was revealed and has `count` mines around it. Adds the sentence for
  // its unknown neighbors, then infers until nothing new can be learned.
  // Throws InvalidMove for an out of bounds or already revealed cell, and
  // Contradiction if `count` doesn't fit what is already known. In both cases
  // nothing is changed.
  void observe(Cell cell, int count);

  // Exactly `count` of `cells` are mines. Cells with known status are removed
  // first, as in observe().
  void add_sentence(CellSet cells, int count);

  void declare_safe(Cell cell);
  void declare_mine(Cell cell);

  // Runs inference to a fixpoint. Returns whether anything was learned.
  bool infer();

  Dims dims() const { return dims_; }
  const CellSet& moves_made() const { return moves_made_; }
  const CellSet& safes() const { return safes_; }
  const CellSet& mines() const { return mines_; }
  const std::vector<Sentence>& sentences() const { return sentences_; }

  bool is_move_made(Cell c) const { return moves_made_.contains(c); }
  bool is_safe(Cell c) const { return safes_.contains(c); }
  bool is_mine(Cell c) const { return mines_.contains(c); }

  void validate() const;

 private:
  // Removes the cells with known status, returning the count of mines left.
  int remove_known(CellSet& cells, int count) const;
  // One pass over the sentences. Returns whether anything was learned.
  bool infer_pass();
  // Drops sentences that are empty or repeat an earlier one.
  void prune();

  Dims dims_;
  CellSet moves_made_;
  CellSet safes_;
  CellSet mines_;
  std::vector<Sentence> sentences_;
};

std::ostream& operator<<(std::ostream& stream, const KnowledgeBase& kb);
