#ifndef AUX_HPP
#define AUX_HPP

#include <iterator>
#include <numeric>
#include <sstream>
#include <string>
#include <vector>

std::vector<std::string> split_at(char sep, const std::string &str);

/** Remove leading and trailing occurrences of any of the symbols */
std::string trim(const std::string &str, const std::string &symbols = " ");

/**
 * Parse a list of numbers separated by sep, e.g. "7.4,0.7,0".
 *
 * Throws std::invalid_argument on tokens that are not numbers.
 */
std::vector<double> parse_numbers(const std::string &str, char sep = ',');

/**
 * Prepends iterator elements by a given symbol.
 */
template <typename InputIt, typename OutputIt, typename T>
void prepend(InputIt first, InputIt last, OutputIt d_first, T value) {
  for (; first != last; ++first) {
    *d_first++ = value;
    *d_first++ = *first;
  }
}

/**
 * Intersperses iterator elements by a given symbol.
 */
template <typename InputIt, typename OutputIt, typename T>
void intersperse(InputIt first, InputIt last, OutputIt d_first, T value) {
  if (first == last) {
    return;
  }
  *d_first = *first;
  prepend(++first, last, ++d_first, value);
}

/**
 * Intersperses iterator by a given symbol and concatenates the result.
 */
template <typename InputIt, typename T>
T intercalate(InputIt begin, InputIt last, const T &x) {
  std::vector<T> ret;
  intersperse(begin, last, std::back_inserter(ret), x);
  return std::accumulate(ret.begin(), ret.end(), T());
}

#endif
