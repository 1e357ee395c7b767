#include "chain.hpp"
#include <stdexcept>
#include <string>
#include "exceptions.hpp"

using namespace std;

namespace BLR {

Chain::Chain(size_t capacity, Index dim)
    : storage(capacity, dim), n(0), is_frozen(false) {}

void Chain::push_back(const Vector &beta) {
  if (is_frozen or full())
    throw logic_error("Error: attempt to append to a frozen chain.");
  if (beta.size() != dim())
    throw Exception::Dimension("length of chain entry " + to_string(n),
                               dim(), beta.size());
  storage.row(n++) = beta.transpose();
  if (full())
    is_frozen = true;
}

void Chain::freeze() { is_frozen = true; }

Vector Chain::operator[](size_t i) const {
  if (i >= n)
    throw out_of_range("Error: chain index " + to_string(i)
                       + " out of range for chain of size " + to_string(n)
                       + ".");
  return storage.row(i).transpose();
}

Vector Chain::back() const {
  if (n == 0)
    throw out_of_range("Error: back() called on an empty chain.");
  return (*this)[n - 1];
}

Matrix Chain::samples() const { return storage.topRows(n); }

Vector Chain::trace(Index j) const {
  if (j < 0 or j >= dim())
    throw out_of_range("Error: coefficient index " + to_string(j)
                       + " out of range.");
  return storage.col(j).head(n);
}

ostream &operator<<(ostream &os, const Chain &chain) {
  os << "Chain of " << chain.size() << " / " << chain.capacity()
     << " samples of dimension " << chain.dim()
     << (chain.frozen() ? " (frozen)" : "");
  return os;
}
}
