#include <atomic>
#include <cmath>
#include <limits>
#include <stdexcept>
#include "exceptions.hpp"
#include "metropolis_hastings.hpp"
#include "sampler.hpp"
#include "test_aux.hpp"

using namespace std;
using namespace BLR;

namespace {
Vector true_coefficients() {
  Vector beta(3);
  beta << 0.5, -1.2, 0.3;
  return beta;
}

Parameters short_run(size_t S) {
  Parameters parameters;
  parameters.num_iterations = S;
  parameters.burn_in = 0;
  parameters.report_interval = 0;
  return parameters;
}
}

void test_accept() {
  const double neg_inf = -numeric_limits<double>::infinity();
  const double nan = numeric_limits<double>::quiet_NaN();
  check(not MetropolisHastings::accept(nan, -10, 0.5), "NaN proposal score");
  check(not MetropolisHastings::accept(neg_inf, -10, 0.5),
        "-inf proposal score");
  check(MetropolisHastings::accept(-10, -10, 0.999999), "equal scores");
  check(MetropolisHastings::accept(-1e6, -10, 0.0), "u = 0");
  check(MetropolisHastings::accept(-9, -10, 0.99), "improvement");
  check(not MetropolisHastings::accept(-20, -10, 0.5), "large decrease");
}

void test_corrupted_state() {
  RNG rng(4);
  const RNG untouched = rng;
  Vector current = true_coefficients();
  double current_score = numeric_limits<double>::quiet_NaN();
  size_t proposals = 0;
  auto generate = [&](const Vector &beta, RNG &rng_) {
    proposals++;
    return Vector(beta + sample_standard_normal(beta.size(), rng_));
  };
  auto score = [](const Vector &beta) { return -beta.squaredNorm(); };
  try {
    MetropolisHastings::step(current, current_score, rng, generate, score);
    throw TestFailure("NaN score of the current state not detected");
  } catch (const BLR::Exception::CorruptedChain &e) {
    check(std::isnan(e.score), "error must carry the offending score");
  }
  check(proposals == 0 and rng == untouched,
        "nothing must be drawn for a corrupted state");
  check(current == true_coefficients(), "state must be left unchanged");

  current_score = numeric_limits<double>::infinity();
  check_throws<BLR::Exception::CorruptedChain>(
      [&]() {
        MetropolisHastings::step(current, current_score, rng, generate, score);
      },
      "infinite score of the current state");

  current_score = score(current);
  MetropolisHastings::step(current, current_score, rng, generate, score);
  check(proposals == 1 and std::isfinite(current_score),
        "finite state must be advanced");
}

void test_seeding() {
  size_t low = 7;
  size_t high = low + (size_t(1) << 32);
  RNG a = EntropySource::make_rng(low);
  RNG b = EntropySource::make_rng(high);
  check(a() != b(), "seeds differing in the upper 32 bits must differ");

  size_t again = 7;
  RNG c = EntropySource::make_rng(again);
  RNG d = EntropySource::make_rng(low);
  check(c == d, "equal seeds must give equal generators");

  size_t random = 0;
  EntropySource::make_rng(random);
  check(random != 0, "a seed of 0 must be replaced and reported");
}

void test_mismatched_data() {
  Matrix X = Matrix::Ones(9, 2);
  IVector y = IVector::Zero(10);
  try {
    Sampler sampler(X, y, short_run(10));
    throw TestFailure("mismatched data not detected");
  } catch (const BLR::Exception::Dimension &e) {
    check(e.expected == 10 and e.actual == 9,
          "dimension error must report 10 labels and 9 rows");
  }
}

void test_invalid_configuration() {
  const auto data = simulate_logistic(50, true_coefficients(), 1);
  check_throws<BLR::Exception::InvalidArgument>(
      [&]() { Sampler sampler(data.first, data.second, short_run(1)); },
      "chain length 1");

  Sampler sampler(data.first, data.second, short_run(10));
  RNG rng(1);
  check_throws<BLR::Exception::Dimension>(
      [&]() { sampler.run(Vector::Zero(2), rng); }, "short initial state");
  Vector init = Vector::Zero(3);
  init(1) = numeric_limits<double>::quiet_NaN();
  check_throws<BLR::Exception::NonFinite>([&]() { sampler.run(init, rng); },
                                     "NaN initial state");
  check(sampler.state() == SamplerState::Initializing,
        "failed validation must leave the sampler unused");

  check_throws<BLR::Exception::Dimension>(
      [&]() {
        Sampler s(data.first, data.second, Matrix::Identity(2, 2),
                  short_run(10));
      },
      "proposal covariance of wrong dimension");
}

void test_determinism() {
  const auto data = simulate_logistic(100, true_coefficients(), 2);
  const Parameters parameters = short_run(500);
  Sampler first(data.first, data.second, parameters);
  Sampler second(data.first, data.second, parameters);
  RNG rng1(42), rng2(42);
  auto a = first.run(Vector::Zero(3), rng1);
  auto b = second.run(Vector::Zero(3), rng2);
  check(a.chain.samples() == b.chain.samples(),
        "identical seeds must give identical chains");
  check(a.accepted == b.accepted, "identical seeds must give identical counts");
}

void test_chain_invariants() {
  const auto data = simulate_logistic(100, true_coefficients(), 3);
  const size_t S = 1000;
  Sampler sampler(data.first, data.second, short_run(S));
  RNG rng(5);
  auto result = sampler.run(Vector::Zero(3), rng);
  const Chain &chain = result.chain;

  check(sampler.state() == SamplerState::Done, "sampler must be done");
  check(chain.size() == S and chain.frozen(), "chain must be full and frozen");
  check(chain.dim() == 3, "chain entries must have the coefficient length");
  check(chain.samples().allFinite(), "chain entries must be finite");
  check(result.proposals == S - 1, "one proposal per iteration");
  check(result.accepted <= result.proposals, "acceptance counter bound");
  check(not result.cancelled, "chain was not cancelled");

  size_t changes = 0;
  for (size_t i = 1; i < S; ++i)
    if (chain[i] != chain[i - 1])
      changes++;
  check(changes == result.accepted,
        "every accepted proposal must change the state");
  check(result.acceptance_rate() > 0.05 and result.acceptance_rate() < 0.95,
        "acceptance rate out of the expected range");

  check_throws<logic_error>([&]() { sampler.run(Vector::Zero(3), rng); },
                            "second run");
}

void test_zero_covariance() {
  const auto data = simulate_logistic(40, true_coefficients(), 4);
  const size_t S = 200;
  Sampler sampler(data.first, data.second, Matrix::Zero(3, 3), short_run(S));
  RNG rng(9);
  const Vector init = true_coefficients();
  auto result = sampler.run(init, rng);
  check(result.accepted == S - 1, "equal scores must always be accepted");
  for (size_t i = 0; i < S; ++i)
    check(result.chain[i] == init, "zero covariance must give a constant chain");
}

void test_cancellation() {
  const auto data = simulate_logistic(40, true_coefficients(), 6);
  Sampler sampler(data.first, data.second, short_run(100));
  RNG rng(2);
  atomic<bool> stop(true);
  auto result = sampler.run(Vector::Zero(3), rng, &stop);
  check(result.cancelled, "result must be marked as cancelled");
  check(result.chain.size() == 1, "only the initial state must be kept");
  check(result.chain.frozen(), "cancelled chain must be frozen");
  check(result.proposals == 0 and result.acceptance_rate() == 0,
        "no proposals after cancellation");
  check(sampler.state() == SamplerState::Done, "sampler must be done");
}

void test_posterior_recovery() {
  const Vector beta = true_coefficients();
  const auto data = simulate_logistic(100, beta, 2017);
  Parameters parameters = short_run(5000);
  const size_t burn_in = 1000;
  Sampler sampler(data.first, data.second, parameters);
  RNG rng(12345);
  auto result = sampler.run(beta, rng);

  const Matrix retained = result.chain.samples().bottomRows(5000 - burn_in);
  const Vector mean = retained.colwise().mean().transpose();
  const Matrix centered = retained.rowwise() - mean.transpose();
  const Vector sd
      = (centered.array().square().colwise().sum() / (retained.rows() - 1))
            .sqrt().transpose();
  for (Index j = 0; j < 3; ++j)
    check(fabs(mean(j) - beta(j)) <= 3 * sd(j),
          "posterior mean of coefficient " + to_string(j)
              + " too far from the true value");
}

int main(int argc, char **argv) {
  return run_tests({{"acceptance test", test_accept},
                    {"corrupted state", test_corrupted_state},
                    {"seeding", test_seeding},
                    {"mismatched data", test_mismatched_data},
                    {"invalid configuration", test_invalid_configuration},
                    {"determinism", test_determinism},
                    {"chain invariants", test_chain_invariants},
                    {"zero covariance", test_zero_covariance},
                    {"cancellation", test_cancellation},
                    {"posterior recovery", test_posterior_recovery}});
}
