#include "io.hpp"

using namespace std;

string write_chain(const BLR::Chain &chain, const vector<string> &names,
                   const string &path, CompressionMode mode) {
  vector<string> iterations;
  for (size_t i = 1; i <= chain.size(); ++i)
    iterations.push_back(to_string(i));
  return write_matrix(chain.samples(), path, mode, iterations, names);
}

string write_frequencies(const array<size_t, 2> &counts, const string &path,
                         CompressionMode mode) {
  return write_file(path, mode, [&](ostream &ofs) {
    print_frequencies(ofs, counts);
  });
}

void print_frequencies(ostream &os, const array<size_t, 2> &counts) {
  const size_t total = counts[0] + counts[1];
  os << "outcome\tcount\tproportion\n";
  for (size_t k = 0; k < 2; ++k)
    os << k << "\t" << counts[k] << "\t"
       << (total > 0 ? 1.0 * counts[k] / total : 0.0) << "\n";
}
