#include "agent.h"

#include <vector>

#include "absl/random/distributions.h"

#include "minesweeper.h"


Agent::Agent(Dims dims, uint64_t seed) : knowledge_(dims), bitgen_(seed) {}

void Agent::reset() {
  knowledge_.reset();
}

std::optional<Cell> Agent::choose_safe_move() const {
  std::optional<Cell> best;
  for (Cell c : knowledge_.safes()) {
    if (!knowledge_.is_move_made(c) && (!best || c < *best)) {
      best = c;
    }
  }
  return best;
}

std::optional<Cell> Agent::choose_random_move() {
  // Row-major so a given seed always picks the same cell.
  std::vector<Cell> choices;
  Dims dims = knowledge_.dims();
  for (int r = 0; r < dims.height; r++) {
    for (int c = 0; c < dims.width; c++) {
      Cell cell(r, c);
      if (!knowledge_.is_move_made(cell) && !knowledge_.is_mine(cell)) {
        choices.push_back(cell);
      }
    }
  }
  if (choices.empty()) {
    return std::nullopt;
  }
  return choices[absl::Uniform<size_t>(bitgen_, 0, choices.size())];
}

Move Agent::choose_move() {
  if (std::optional<Cell> c = choose_safe_move()) {
    return {SAFE, *c};
  }
  if (std::optional<Cell> c = choose_random_move()) {
    return {RANDOM, *c};
  }
  return {STUCK, {0, 0}};
}
