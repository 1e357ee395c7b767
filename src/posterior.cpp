#include "posterior.hpp"
#include <cmath>
#include <limits>
#include "exceptions.hpp"
#include "pdist.hpp"

using namespace std;

namespace BLR {

namespace {
const Float neg_inf = -numeric_limits<Float>::infinity();
}

void validate_data(const Matrix &X, const IVector &y) {
  if (static_cast<size_t>(X.rows()) != static_cast<size_t>(y.size()))
    throw Exception::Dimension("number of rows of the design matrix",
                               y.size(), X.rows());
  if (X.cols() == 0)
    throw Exception::InvalidArgument("the design matrix has no columns.");
  for (Index n = 0; n < y.size(); ++n)
    if (y(n) > 1)
      throw Exception::InvalidArgument(
          "response label " + to_string(y(n)) + " in row "
          + to_string(n) + " is neither 0 nor 1.");
  if (not X.allFinite())
    throw Exception::NonFinite("the design matrix");
}

Float log_likelihood(const Vector &beta, const Matrix &X, const IVector &y) {
  if (beta.size() != X.cols())
    throw Exception::Dimension("length of the coefficient vector", X.cols(),
                               beta.size());
  if (not beta.allFinite())
    return neg_inf;
  const Vector eta = X * beta;
  if (not eta.allFinite())
    return neg_inf;
  Float l = 0;
  for (Index n = 0; n < eta.size(); ++n)
    l += log_bernoulli_logit(y(n), eta(n));
  return l;
}

Float log_prior(const Vector &beta, Float sd) {
  Float l = 0;
  for (Index i = 0; i < beta.size(); ++i)
    l += log_normal(beta(i), 0, sd);
  return l;
}

Float log_posterior(const Vector &beta, const Matrix &X, const IVector &y,
                    Float prior_sd) {
  const Float l = log_likelihood(beta, X, y);
  if (l == neg_inf)
    return neg_inf;
  const Float p = l + log_prior(beta, prior_sd);
  if (std::isnan(p))
    return neg_inf;
  return p;
}
}
