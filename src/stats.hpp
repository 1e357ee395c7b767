#ifndef STATS_HPP
#define STATS_HPP

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace Stats {

template <typename V>
double compute_mean(const V &v) {
  double sum = 0;
  for (size_t i = 0; i < size_t(v.size()); ++i)
    sum += v[i];
  return sum / v.size();
}

/** Sample standard deviation, with n - 1 denominator */
template <typename V>
double compute_sd(const V &v) {
  const double mean = compute_mean(v);
  double sum = 0;
  for (size_t i = 0; i < size_t(v.size()); ++i)
    sum += (v[i] - mean) * (v[i] - mean);
  return std::sqrt(sum / (v.size() - 1));
}

/**
 * Percentiles by the nearest-rank method
 *
 * @param percentiles Values in [0, 1]
 */
template <typename V>
std::vector<double> get_percentiles(const V &v,
                                    const std::vector<double> &percentiles) {
  std::vector<double> sorted(v.size());
  for (size_t i = 0; i < sorted.size(); ++i)
    sorted[i] = v[i];
  std::sort(begin(sorted), end(sorted));
  std::vector<double> values;
  const size_t n = sorted.size();
  for (auto p : percentiles) {
    size_t rank = std::ceil(p * n);
    values.push_back(sorted[rank > 0 ? rank - 1 : 0]);
  }
  return values;
}

/** Header line for summary() */
inline std::string summary_header(const std::vector<double> &percentiles
                                  = {0.025, 0.25, 0.5, 0.75, 0.975},
                                  size_t width = 12) {
  std::stringstream ss;
  ss << std::setw(width) << std::right << "Mean";
  ss << std::setw(width) << std::right << "SD";
  for (auto &x : percentiles)
    ss << std::setw(width) << std::right << x;
  return ss.str();
}

/** Mean, standard deviation, and percentiles of a sample in one line */
template <typename V>
std::string summary(const V &v,
                    const std::vector<double> &percentiles
                    = {0.025, 0.25, 0.5, 0.75, 0.975},
                    size_t width = 12) {
  std::stringstream ss;
  ss << std::setw(width) << std::right << compute_mean(v);
  ss << std::setw(width) << std::right << compute_sd(v);
  for (auto x : get_percentiles(v, percentiles))
    ss << std::setw(width) << std::right << x;
  return ss.str();
}
}

#endif
