#ifndef SAMPLER_HPP
#define SAMPLER_HPP

#include <atomic>
#include <iostream>
#include "chain.hpp"
#include "entropy.hpp"
#include "parameters.hpp"
#include "proposal.hpp"
#include "types.hpp"

namespace BLR {

enum class SamplerState { Initializing, Sampling, Done };

std::ostream &operator<<(std::ostream &os, SamplerState state);

struct SamplingResult {
  Chain chain;
  /** Number of accepted proposals */
  size_t accepted;
  /** Number of proposals made; chain.size() - 1 */
  size_t proposals;
  /** Set if sampling was stopped through the stop flag */
  bool cancelled;

  double acceptance_rate() const;
};

/**
 * Random-walk Metropolis-Hastings sampler for the coefficients of a Bayesian
 * logistic regression with independent normal priors.
 *
 * The data is held by reference and must outlive the sampler. Construction
 * validates the data and the parameters and factorizes the proposal
 * covariance; run() may be called once.
 */
class Sampler {
public:
  /** Uses proposal_scale * (X^T X)^-1 as proposal covariance */
  Sampler(const Matrix &X, const IVector &y, const Parameters &parameters);
  Sampler(const Matrix &X, const IVector &y, const Matrix &covariance,
          const Parameters &parameters);

  /**
   * Draw a chain of parameters.num_iterations samples starting from init.
   *
   * The stop flag, if given, is checked before each iteration; when it is set
   * sampling ends early and the result is marked as cancelled.
   */
  SamplingResult run(const Vector &init, RNG &rng,
                     const std::atomic<bool> *stop = nullptr);

  SamplerState state() const { return current_state; }
  const Proposal &proposal() const { return random_walk; }

  double log_posterior(const Vector &beta) const;

private:
  const Matrix &X;
  const IVector &y;
  Parameters parameters;
  Proposal random_walk;
  SamplerState current_state;

  void validate_init(const Vector &init) const;
};
}

#endif
