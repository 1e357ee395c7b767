#ifndef CHAIN_HPP
#define CHAIN_HPP

#include <iostream>
#include "types.hpp"

namespace BLR {

/**
 * Append-only sequence of coefficient vectors with a fixed capacity.
 *
 * Storage for all samples is allocated up front; sample i is row i of the
 * underlying matrix. A chain is frozen once full or when freeze() is called,
 * after which it can only be read.
 */
class Chain {
public:
  Chain(size_t capacity, Index dim);

  void push_back(const Vector &beta);
  void freeze();

  Vector operator[](size_t i) const;
  Vector back() const;

  size_t size() const { return n; }
  size_t capacity() const { return storage.rows(); }
  Index dim() const { return storage.cols(); }
  bool empty() const { return n == 0; }
  bool full() const { return n == capacity(); }
  bool frozen() const { return is_frozen; }

  /** Matrix of the samples stored so far, one per row */
  Matrix samples() const;
  /** Trace of coefficient j across the samples stored so far */
  Vector trace(Index j) const;

private:
  Matrix storage;
  size_t n;
  bool is_frozen;
};

std::ostream &operator<<(std::ostream &os, const Chain &chain);
}

#endif
