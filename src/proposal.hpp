#ifndef PROPOSAL_HPP
#define PROPOSAL_HPP

#include "entropy.hpp"
#include "types.hpp"

namespace BLR {

/**
 * Covariance of the random-walk proposal: scale * (X^T X)^-1.
 *
 * Throws Exception::NotPositiveDefinite if X^T X is singular, i.e. if the
 * design matrix does not have full column rank.
 */
Matrix proposal_covariance(const Matrix &X, Float scale);

/**
 * Symmetric multivariate normal random-walk proposal.
 *
 * The covariance is factorized once on construction. Positive semi-definite
 * covariances are accepted, so that a zero covariance yields proposals equal
 * to the current state.
 */
class Proposal {
public:
  explicit Proposal(const Matrix &covariance);

  /** Draw a candidate from N(current, covariance) */
  Vector propose(const Vector &current, RNG &rng) const;

  Index dim() const { return factor.rows(); }
  const Matrix &covariance() const { return cov; }

private:
  Matrix cov;
  /** cov = factor * factor^T */
  Matrix factor;
};
}

#endif
