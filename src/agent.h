#pragma once

#include <optional>

#include "cell.h"
#include "knowledge.h"
#include "minesweeper.h"
#include "random.h"


class Agent {
 public:
  Agent(Dims dims, uint64_t seed = 0);
  void reset();

  void observe(Cell cell, int count) { knowledge_.observe(cell, count); }

  // A proven safe cell that hasn't been revealed yet, the smallest if several.
  std::optional<Cell> choose_safe_move() const;
  // Uniformly random among the cells neither revealed nor known to be mines.
  std::optional<Cell> choose_random_move();
  // A safe move if there is one, otherwise a random one, otherwise STUCK.
  Move choose_move();

  const KnowledgeBase& knowledge() const { return knowledge_; }

 private:
  KnowledgeBase knowledge_;
  Xoshiro256pp bitgen_;
};
