#include "predictive.hpp"
#include <stdexcept>
#include <string>
#include "exceptions.hpp"
#include "pdist.hpp"
#include "sampling.hpp"

using namespace std;

namespace BLR {

namespace {
void validate(const Chain &chain, const Vector &x_new, size_t burn_in) {
  if (x_new.size() != chain.dim())
    throw Exception::Dimension("length of the new covariate vector",
                               chain.dim(), x_new.size());
  if (not x_new.allFinite())
    throw Exception::NonFinite("the new covariate vector");
  if (burn_in >= chain.size())
    throw Exception::InvalidArgument(
        "the burn-in of " + to_string(burn_in)
        + " samples leaves nothing of a chain of " + to_string(chain.size())
        + " samples.");
}
}

PosteriorPredictive::PosteriorPredictive(const Chain &chain_,
                                         const Vector &x_new_, size_t burn_in,
                                         RNG &rng_)
    : chain(chain_), x_new(x_new_), position(burn_in), rng(rng_) {
  validate(chain, x_new, burn_in);
}

Int PosteriorPredictive::next() {
  if (done())
    throw out_of_range("Error: posterior predictive sequence exhausted.");
  const double eta = chain[position++].dot(x_new);
  return sample_bernoulli(sigmoid(eta), rng);
}

vector<Int> PosteriorPredictive::drain() {
  vector<Int> draws;
  draws.reserve(remaining());
  while (not done())
    draws.push_back(next());
  return draws;
}

PosteriorPredictive predict(const Chain &chain, const Vector &x_new,
                            size_t burn_in, RNG &rng) {
  return PosteriorPredictive(chain, x_new, burn_in, rng);
}

array<size_t, 2> tabulate(PosteriorPredictive &draws) {
  array<size_t, 2> counts = {{0, 0}};
  while (not draws.done())
    counts[draws.next()]++;
  return counts;
}

double mean_probability(const Chain &chain, const Vector &x_new,
                        size_t burn_in) {
  validate(chain, x_new, burn_in);
  double sum = 0;
  for (size_t i = burn_in; i < chain.size(); ++i)
    sum += sigmoid(chain[i].dot(x_new));
  return sum / (chain.size() - burn_in);
}
}
