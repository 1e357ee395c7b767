#ifndef GLM_HPP
#define GLM_HPP

#include <iostream>
#include "types.hpp"

namespace BLR {

struct MLEFit {
  Vector coefficients;
  /** -2 times the log likelihood at the coefficients */
  Float deviance;
  size_t iterations;
  bool converged;
};

/**
 * Maximum-likelihood fit of a logistic regression by iteratively reweighted
 * least squares.
 *
 * Each step solves the weighted normal equations by Cholesky decomposition and
 * halves the step while the deviance does not decrease. Iteration stops once
 * |dev_new - dev_old| / (|dev_new| + 0.1) <= tolerance. Under complete
 * separation the coefficients diverge and the fit is reported as not
 * converged.
 */
MLEFit fit_logistic_mle(const Matrix &X, const IVector &y,
                        size_t max_iterations = 50, Float tolerance = 1e-8);

std::ostream &operator<<(std::ostream &os, const MLEFit &fit);
}

#endif
