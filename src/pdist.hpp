#ifndef PDIST_HPP
#define PDIST_HPP

#include <cmath>

// Continuous probability distributions

/** Normal probability density function for x given mean mu and standard
 * deviation sigma */
double log_normal(double x, double mu, double sigma);

// Logistic link

/**
 * Logarithm of the logistic function, log(1 / (1 + exp(-eta))).
 *
 * Evaluated in two branches so that exp() is only ever applied to
 * non-positive arguments.
 */
inline double log_sigmoid(double eta) {
  if (eta >= 0)
    return -std::log1p(std::exp(-eta));
  else
    return eta - std::log1p(std::exp(eta));
}

/** Logistic function; exactly 0.5 for eta = 0 */
inline double sigmoid(double eta) {
  if (eta >= 0)
    return 1 / (1 + std::exp(-eta));
  else {
    const double e = std::exp(eta);
    return e / (1 + e);
  }
}

// Discrete probability distributions

/** Bernoulli probability mass function for outcome y in {0,1} with success
 * probability sigmoid(eta). Uses log(1 - sigmoid(eta)) = log_sigmoid(-eta). */
inline double log_bernoulli_logit(unsigned int y, double eta) {
  return y == 1 ? log_sigmoid(eta) : log_sigmoid(-eta);
}

#endif
