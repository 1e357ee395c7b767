#ifndef IO_HPP
#define IO_HPP
#include <array>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "chain.hpp"
#include "compression.hpp"
#include "types.hpp"

template <typename V>
std::string write_vector(const V &v, const std::string &path,
                         CompressionMode mode,
                         const std::vector<std::string> &names
                         = std::vector<std::string>(),
                         const std::string &separator = "\t") {
  size_t X = v.size();

  bool names_given = not names.empty();

  if (names_given and names.size() != X)
    throw(std::runtime_error(
        "Error: length of names (" + std::to_string(names.size())
        + ") does not match length of vector (" + std::to_string(X) + ")."));

  return write_file(path, mode, [&](std::ostream &ofs) {
    ofs.precision(17);
    for (size_t x = 0; x < X; ++x)
      ofs << (names_given ? names[x] + separator : "") << v[x] << '\n';
  });
}

template <typename M>
std::string write_matrix(const M &m, const std::string &path,
                         CompressionMode mode,
                         const std::vector<std::string> &row_names
                         = std::vector<std::string>(),
                         const std::vector<std::string> &col_names
                         = std::vector<std::string>(),
                         const std::string &separator = "\t") {
  size_t X = m.rows();
  size_t Y = m.cols();

  bool row_names_given = not row_names.empty();
  bool col_names_given = not col_names.empty();

  if (row_names_given and row_names.size() != X)
    throw(std::runtime_error(
        "Error: length of row names (" + std::to_string(row_names.size())
        + ") does not match number of rows (" + std::to_string(X) + ")."));

  if (col_names_given and col_names.size() != Y)
    throw(std::runtime_error(
        "Error: length of col names (" + std::to_string(col_names.size())
        + ") does not match number of cols (" + std::to_string(Y) + ")."));

  return write_file(path, mode, [&](std::ostream &ofs) {
    ofs.precision(17);
    if (col_names_given) {
      for (size_t y = 0; y < Y; ++y)
        ofs << (y != 0 or row_names_given ? separator : "") << col_names[y];
      ofs << '\n';
    }
    for (size_t x = 0; x < X; ++x) {
      if (row_names_given)
        ofs << row_names[x] + separator;
      for (size_t y = 0; y < Y; ++y)
        ofs << (y != 0 ? separator : "") << m(x, y);
      ofs << '\n';
    }
  });
}

/** Write the chain with one row per iteration, numbered from 1 */
std::string write_chain(const BLR::Chain &chain,
                        const std::vector<std::string> &names,
                        const std::string &path, CompressionMode mode);

/** Write a two row frequency table of predictive draws */
std::string write_frequencies(const std::array<size_t, 2> &counts,
                              const std::string &path, CompressionMode mode);

void print_frequencies(std::ostream &os, const std::array<size_t, 2> &counts);

#endif
