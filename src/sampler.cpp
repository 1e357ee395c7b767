#include "sampler.hpp"
#include <cmath>
#include <stdexcept>
#include "exceptions.hpp"
#include "log.hpp"
#include "metropolis_hastings.hpp"
#include "posterior.hpp"

using namespace std;

namespace BLR {

ostream &operator<<(ostream &os, SamplerState state) {
  switch (state) {
    case SamplerState::Initializing:
      os << "initializing";
      break;
    case SamplerState::Sampling:
      os << "sampling";
      break;
    case SamplerState::Done:
      os << "done";
      break;
  }
  return os;
}

double SamplingResult::acceptance_rate() const {
  if (proposals == 0)
    return 0;
  return 1.0 * accepted / proposals;
}

namespace {
// validation has to happen before the proposal covariance is derived from X
const Matrix &validated(const Matrix &X, const IVector &y,
                        const Parameters &parameters) {
  parameters.validate();
  validate_data(X, y);
  return X;
}
}

Sampler::Sampler(const Matrix &X_, const IVector &y_,
                 const Parameters &parameters_)
    : Sampler(X_, y_, proposal_covariance(validated(X_, y_, parameters_),
                                          parameters_.proposal_scale),
              parameters_) {}

Sampler::Sampler(const Matrix &X_, const IVector &y_, const Matrix &covariance,
                 const Parameters &parameters_)
    : X(validated(X_, y_, parameters_)),
      y(y_),
      parameters(parameters_),
      random_walk(covariance),
      current_state(SamplerState::Initializing) {
  if (random_walk.dim() != X.cols())
    throw Exception::Dimension("dimension of the proposal covariance",
                               X.cols(), random_walk.dim());
  LOG(verbose) << "Initialized sampler for " << X.rows() << " observations and "
               << X.cols() << " coefficients.";
}

double Sampler::log_posterior(const Vector &beta) const {
  return BLR::log_posterior(beta, X, y, parameters.prior_sd);
}

void Sampler::validate_init(const Vector &init) const {
  if (init.size() != X.cols())
    throw Exception::Dimension("length of the initial coefficient vector",
                               X.cols(), init.size());
  if (not init.allFinite())
    throw Exception::NonFinite("the initial coefficient vector");
}

SamplingResult Sampler::run(const Vector &init, RNG &rng,
                            const atomic<bool> *stop) {
  if (current_state != SamplerState::Initializing)
    throw logic_error("Error: the sampler has already been run.");

  validate_init(init);
  double current_score = log_posterior(init);
  if (not isfinite(current_score))
    throw Exception::NonFinite("the log posterior of the initial state");

  const size_t S = parameters.num_iterations;
  SamplingResult result = {Chain(S, X.cols()), 0, 0, false};
  Chain &chain = result.chain;
  chain.push_back(init);
  Vector current = init;

  auto generate = [this](const Vector &beta, RNG &rng_) {
    return random_walk.propose(beta, rng_);
  };
  auto score = [this](const Vector &beta) { return log_posterior(beta); };

  current_state = SamplerState::Sampling;
  LOG(info) << "Sampling " << S << " states; initial log posterior = "
            << current_score;

  for (size_t i = 1; i < S; ++i) {
    if (stop != nullptr and stop->load()) {
      LOG(warning) << "Sampling cancelled after " << i << " of " << S
                   << " states.";
      result.cancelled = true;
      break;
    }

    try {
      if (MetropolisHastings::step(current, current_score, rng, generate,
                                   score))
        result.accepted++;
    } catch (const Exception::CorruptedChain &) {
      LOG(fatal) << "Chain corrupted before iteration " << i << " of " << S
                 << ".";
      throw;
    }
    result.proposals++;
    chain.push_back(current);

    if (parameters.report_interval > 0
        and (i + 1) % parameters.report_interval == 0)
      LOG(info) << "Iteration " << (i + 1) << " / " << S
                << " acceptance rate = " << result.acceptance_rate()
                << " log posterior = " << current_score;
  }

  chain.freeze();
  current_state = SamplerState::Done;
  LOG(info) << "Performed " << result.proposals
            << " Metropolis-Hastings iterations; accepted "
            << result.accepted << " (" << 100 * result.acceptance_rate()
            << "%).";
  return result;
}
}
