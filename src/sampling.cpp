#include "sampling.hpp"

namespace BLR {

Vector sample_multivariate_normal(const Vector &mean, const Matrix &factor,
                                  RNG &rng) {
  const Vector z = sample_standard_normal(factor.cols(), rng);
  return mean + factor * z;
}

Int sample_bernoulli(double p, RNG &rng) {
  return sample_uniform(rng) < p ? 1 : 0;
}
}
