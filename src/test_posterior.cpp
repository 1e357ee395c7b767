#include <cmath>
#include <limits>
#include "exceptions.hpp"
#include "posterior.hpp"
#include "test_aux.hpp"

using namespace std;
using namespace BLR;

namespace {
Matrix small_design() {
  Matrix X(4, 3);
  X << 1, 0.5, -1.0,
       1, -1.5, 0.2,
       1, 0.3, 0.7,
       1, 2.0, -0.4;
  return X;
}

IVector small_response() {
  IVector y(4);
  y << 1, 0, 0, 1;
  return y;
}

// direct evaluation, adequate for moderate linear predictors
double naive_log_posterior(const Vector &beta, const Matrix &X,
                           const IVector &y, double sd) {
  double l = 0;
  for (Index n = 0; n < X.rows(); ++n) {
    const double p = exp(X.row(n).dot(beta)) / (1 + exp(X.row(n).dot(beta)));
    l += y(n) == 1 ? log(p) : log(1 - p);
  }
  for (Index i = 0; i < beta.size(); ++i)
    l += -0.5 * log(2 * M_PI * sd * sd) - beta(i) * beta(i) / (2 * sd * sd);
  return l;
}
}

void test_matches_direct_evaluation() {
  const Matrix X = small_design();
  const IVector y = small_response();
  Vector beta(3);
  beta << 0.5, -1.2, 0.3;
  const double expected = naive_log_posterior(beta, X, y, 10);
  check(fabs(log_posterior(beta, X, y, 10) - expected) < 1e-12,
        "log posterior differs from the direct evaluation");
  check(fabs(log_prior(beta, 10) + log_likelihood(beta, X, y)
             - log_posterior(beta, X, y, 10))
            < 1e-12,
        "log posterior is the sum of log prior and log likelihood");
}

void test_pure() {
  const Matrix X = small_design();
  const IVector y = small_response();
  Vector beta(3);
  beta << -0.7, 2.0, 1.1;
  const double first = log_posterior(beta, X, y, 10);
  const double second = log_posterior(beta, X, y, 10);
  check(first == second, "repeated evaluation must give identical results");
}

void test_large_linear_predictor() {
  const Matrix X = small_design();
  const IVector y = small_response();
  Vector beta(3);
  beta << 400, -300, 500;
  const double l = log_posterior(beta, X, y, 10);
  check(isfinite(l), "log posterior must be finite for |eta| in the hundreds");
  check(l < naive_log_posterior(Vector::Zero(3), X, y, 10),
        "log posterior of extreme coefficients must be small");
}

void test_degenerate_input() {
  const Matrix X = small_design();
  const IVector y = small_response();
  const double neg_inf = -numeric_limits<double>::infinity();

  Vector beta = Vector::Zero(3);
  beta(1) = numeric_limits<double>::quiet_NaN();
  check(log_posterior(beta, X, y, 10) == neg_inf, "NaN coefficient gives -inf");

  beta(1) = numeric_limits<double>::infinity();
  check(log_posterior(beta, X, y, 10) == neg_inf, "infinite coefficient gives -inf");

  beta << 1e200, 1e200, 0;
  const double l = log_posterior(beta, X, y, 10);
  check(not isnan(l), "overflowing prior must not give NaN");
  check(l == neg_inf, "overflowing prior gives -inf");
}

void test_validation() {
  const Matrix X = small_design();
  IVector y(5);
  y << 1, 0, 0, 1, 1;
  try {
    validate_data(X, y);
    throw TestFailure("row mismatch not detected");
  } catch (const BLR::Exception::Dimension &e) {
    check(e.expected == 5 and e.actual == 4,
          "dimension error must report expected and actual sizes");
  }

  IVector y2 = small_response();
  y2(2) = 2;
  check_throws<BLR::Exception::InvalidArgument>([&]() { validate_data(X, y2); },
                                           "label 2 must be rejected");

  check_throws<BLR::Exception::Dimension>(
      [&]() { log_likelihood(Vector::Zero(2), X, small_response()); },
      "wrong coefficient length must be rejected");
}

int main(int argc, char **argv) {
  return run_tests({{"matches direct evaluation", test_matches_direct_evaluation},
                    {"pure", test_pure},
                    {"large linear predictor", test_large_linear_predictor},
                    {"degenerate input", test_degenerate_input},
                    {"validation", test_validation}});
}
