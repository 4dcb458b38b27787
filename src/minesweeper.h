#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "cell.h"

// The in-bounds cells around `c`, excluding `c` itself, in (row, col) order.
class Neighbors {
 public:
  Neighbors(Cell c, Dims dims) : count_(0) {
    for (int r = c.row - 1; r <= c.row + 1; r++) {
      for (int k = c.col - 1; k <= c.col + 1; k++) {
        Cell n(r, k);
        if (n != c && dims.contains(n)) {
          neighbors_[count_++] = n;
        }
      }
    }
  }

  const Cell* begin() const { return neighbors_; }
  const Cell* end() const   { return neighbors_ + count_; }
  int size() const { return count_; }

 private:
  Cell neighbors_[8];
  int count_;
};


template<class T>
class Array2D {
 public:
  Array2D(Dims dims) : dims_(dims) {
    array.resize(dims_.size());
  }

  T& operator[](Cell c) {                  return array[c.row * dims_.width + c.col]; }
  const T& operator[](Cell c) const {      return array[c.row * dims_.width + c.col]; }
  T& operator()(int row, int col) {             return array[row * dims_.width + col]; }
  const T& operator()(int row, int col) const { return array[row * dims_.width + col]; }

  void fill(const T& v) {
    for (int i = 0; i < dims_.size(); i++) {
      array[i] = v;
    }
  }
  int width() const { return dims_.width; }
  int height() const { return dims_.height; }
  Dims dims() const { return dims_; }
  int size() const { return dims_.size(); }

 private:
  Dims dims_;
  std::vector<T> array;
};


// The knowledge is inconsistent: a cell was proven both safe and a mine, or a
// sentence's count fell outside [0, |cells|]. Either the inference is wrong or
// the board lied, so there is no sensible way to continue.
class Contradiction : public std::logic_error {
 public:
  explicit Contradiction(const std::string& what) : std::logic_error(what) {}
};

// The caller asked for something that isn't a legal move. Nothing was changed.
class InvalidMove : public std::invalid_argument {
 public:
  explicit InvalidMove(const std::string& what) : std::invalid_argument(what) {}
};


enum MoveType : int8_t {
  STUCK,
  SAFE,
  RANDOM,
};

struct Move {
  MoveType type;
  Cell cell;
  bool operator==(const Move&) const = default;
  bool operator!=(const Move&) const = default;
};
