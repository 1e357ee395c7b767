#ifndef PREDICTIVE_HPP
#define PREDICTIVE_HPP

#include <array>
#include <vector>
#include "chain.hpp"
#include "entropy.hpp"
#include "types.hpp"

namespace BLR {

/**
 * Lazy sequence of posterior predictive draws for a new observation.
 *
 * Yields one Bernoulli(sigmoid(beta . x_new)) outcome for every chain sample
 * beta after the first burn_in ones. The sequence is finite and can not be
 * restarted; the chain is only read. Chain and generator are held by
 * reference and must outlive the sequence.
 */
class PosteriorPredictive {
public:
  /**
   * Throws Exception::Dimension if x_new does not match the chain dimension
   * and Exception::InvalidArgument if burn_in is not smaller than the chain.
   */
  PosteriorPredictive(const Chain &chain, const Vector &x_new, size_t burn_in,
                      RNG &rng);

  bool done() const { return position == chain.size(); }
  size_t remaining() const { return chain.size() - position; }

  /** Next draw; throws std::out_of_range when the sequence is exhausted */
  Int next();

  /** Consume all remaining draws */
  std::vector<Int> drain();

private:
  const Chain &chain;
  Vector x_new;
  size_t position;
  RNG &rng;
};

PosteriorPredictive predict(const Chain &chain, const Vector &x_new,
                            size_t burn_in, RNG &rng);

/** Count the zeros and ones among the remaining draws */
std::array<size_t, 2> tabulate(PosteriorPredictive &draws);

/** Average of sigmoid(beta . x_new) over the chain samples after burn-in */
double mean_probability(const Chain &chain, const Vector &x_new,
                        size_t burn_in);
}

#endif
