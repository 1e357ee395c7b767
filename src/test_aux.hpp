#ifndef TEST_AUX_HPP
#define TEST_AUX_HPP

#include <cstdlib>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "entropy.hpp"
#include "log.hpp"
#include "pdist.hpp"
#include "sampling.hpp"
#include "types.hpp"

struct TestFailure : public std::runtime_error {
  TestFailure(const std::string &msg) : std::runtime_error(msg){};
};

inline void check(bool condition, const std::string &msg) {
  if (not condition)
    throw TestFailure(msg);
}

/** Fails unless fnc throws an exception of type E */
template <typename E, typename Fnc>
void check_throws(Fnc fnc, const std::string &msg) {
  try {
    fnc();
  } catch (const E &e) {
    return;
  }
  throw TestFailure(msg + " (no exception thrown)");
}

using Test = std::pair<std::string, std::function<void()>>;

/** Run the tests in order; stop at the first failure */
inline int run_tests(const std::vector<Test> &tests) {
  // keep per-iteration sampler output off the console
  init_logging("", Verbosity::warning);
  for (auto &test : tests) {
    try {
      test.second();
    } catch (std::exception &e) {
      std::cout << "FAILED " << test.first << ": " << e.what() << std::endl;
      return EXIT_FAILURE;
    }
    std::cout << "passed " << test.first << std::endl;
  }
  return EXIT_SUCCESS;
}

/**
 * Simulate N observations of a logistic regression model with an intercept
 * and beta.size() - 1 standard normal covariates.
 */
inline std::pair<BLR::Matrix, BLR::IVector> simulate_logistic(
    size_t N, const BLR::Vector &beta, size_t seed) {
  RNG rng(seed);
  std::normal_distribution<double> normal(0, 1);
  const BLR::Index P = beta.size();
  BLR::Matrix X(N, P);
  BLR::IVector y(N);
  for (size_t n = 0; n < N; ++n) {
    X(n, 0) = 1;
    for (BLR::Index p = 1; p < P; ++p)
      X(n, p) = normal(rng);
    y(n) = BLR::sample_bernoulli(sigmoid(X.row(n).dot(beta)), rng);
  }
  return std::make_pair(X, y);
}

#endif
