#include <stdexcept>
#include "exceptions.hpp"
#include "predictive.hpp"
#include "test_aux.hpp"

using namespace std;
using namespace BLR;

namespace {
/** Chain of S copies of beta */
Chain constant_chain(size_t S, const Vector &beta) {
  Chain chain(S, beta.size());
  for (size_t i = 0; i < S; ++i)
    chain.push_back(beta);
  return chain;
}

Vector coefficients(double intercept, double a, double b) {
  Vector beta(3);
  beta << intercept, a, b;
  return beta;
}

Vector intercept_only() {
  Vector x = Vector::Zero(3);
  x(0) = 1;
  return x;
}
}

void test_even_odds() {
  const size_t burn_in = 100;
  const Chain chain = constant_chain(10000 + burn_in, coefficients(0, 2, -3));
  const Vector x_new = intercept_only();
  check(mean_probability(chain, x_new, burn_in) == 0.5,
        "zero linear predictor must give probability one half");

  RNG rng(2024);
  auto draws = predict(chain, x_new, burn_in, rng);
  check(draws.remaining() == 10000, "one draw per retained sample");
  auto counts = tabulate(draws);
  const double proportion = 1.0 * counts[1] / (counts[0] + counts[1]);
  check(counts[0] + counts[1] == 10000, "frequency table must cover all draws");
  check(proportion >= 0.47 and proportion <= 0.53,
        "proportion of ones far from one half");
}

void test_idempotent() {
  Chain chain(50, 3);
  RNG chain_rng(3);
  for (size_t i = 0; i < 50; ++i)
    chain.push_back(sample_standard_normal(3, chain_rng));
  const Matrix before = chain.samples();
  Vector x_new(3);
  x_new << 1, 0.5, -0.25;

  RNG rng1(77), rng2(77);
  auto first = predict(chain, x_new, 10, rng1).drain();
  auto second = predict(chain, x_new, 10, rng2).drain();
  check(first == second, "identical seeds must give identical draws");
  check(first.size() == 40, "burn-in samples must be skipped");
  check(chain.samples() == before, "prediction must not alter the chain");
}

void test_invalid_input() {
  const Chain chain = constant_chain(20, coefficients(0, 0, 0));
  RNG rng(5);
  const RNG untouched = rng;
  check_throws<BLR::Exception::Dimension>(
      [&]() { predict(chain, Vector::Ones(4), 0, rng); },
      "new observation of wrong length");
  check(rng == untouched, "no draws before validation");
  check_throws<BLR::Exception::InvalidArgument>(
      [&]() { predict(chain, intercept_only(), 20, rng); },
      "burn-in covering the chain");
  check_throws<BLR::Exception::InvalidArgument>(
      [&]() { mean_probability(chain, intercept_only(), 25); },
      "burn-in beyond the chain");

  auto draws = predict(chain, intercept_only(), 18, rng);
  draws.next();
  draws.next();
  check(draws.done(), "sequence must be finite");
  check_throws<out_of_range>([&]() { draws.next(); }, "exhausted sequence");
}

void test_certain_outcomes() {
  RNG rng(8);
  const Chain ones = constant_chain(100, coefficients(1000, 0, 0));
  for (auto x : predict(ones, intercept_only(), 0, rng).drain())
    check(x == 1, "huge linear predictor must give ones");
  const Chain zeros = constant_chain(100, coefficients(-1000, 0, 0));
  for (auto x : predict(zeros, intercept_only(), 0, rng).drain())
    check(x == 0, "very negative linear predictor must give zeros");
}

int main(int argc, char **argv) {
  return run_tests({{"even odds", test_even_odds},
                    {"idempotent", test_idempotent},
                    {"invalid input", test_invalid_input},
                    {"certain outcomes", test_certain_outcomes}});
}
