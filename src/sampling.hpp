#ifndef SAMPLING_HPP
#define SAMPLING_HPP

#include <random>
#include "entropy.hpp"
#include "types.hpp"

namespace BLR {

inline double sample_uniform(RNG &rng) {
  return std::uniform_real_distribution<double>(0, 1)(rng);
}

/** Draw n independent standard normal values, in index order */
template <typename V = Vector>
V sample_standard_normal(size_t n, RNG &rng) {
  std::normal_distribution<double> normal(0, 1);
  V z(n);
  for (size_t i = 0; i < n; ++i)
    z[i] = normal(rng);
  return z;
}

/**
 * Draw from a multivariate normal distribution given its mean and a factor F
 * of its covariance, i.e. covariance = F * F^T.
 */
Vector sample_multivariate_normal(const Vector &mean, const Matrix &factor,
                                  RNG &rng);

/** Draw a Bernoulli(p) outcome from a single uniform deviate */
Int sample_bernoulli(double p, RNG &rng);
}

#endif
