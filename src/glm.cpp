#include "glm.hpp"
#include <algorithm>
#include <cfloat>
#include <cmath>
#include "exceptions.hpp"
#include "log.hpp"
#include "pdist.hpp"
#include "posterior.hpp"

using namespace std;

namespace BLR {

namespace {
double clipped_sigmoid(double eta) {
  return min(max(sigmoid(eta), DBL_EPSILON), 1.0 - DBL_EPSILON);
}

double deviance(const Vector &eta, const IVector &y) {
  double l = 0;
  for (Index n = 0; n < eta.size(); ++n)
    l += log_bernoulli_logit(y(n), eta(n));
  return -2 * l;
}

// Coefficients of one IRLS step from the linear predictor eta
Vector irls_step(const Matrix &X, const IVector &y, const Vector &eta) {
  const Index N = X.rows();
  Vector sw(N), zw(N);
  for (Index n = 0; n < N; ++n) {
    const double mu = clipped_sigmoid(eta(n));
    const double w = mu * (1 - mu);
    sw(n) = sqrt(w);
    zw(n) = sw(n) * (eta(n) + (y(n) - mu) / w);
  }
  const Matrix Xw = (X.array().colwise() * sw.array()).matrix();
  Matrix xtwx = Xw.transpose() * Xw;
  const Vector xtwz = Xw.transpose() * zw;

  Eigen::LLT<Matrix> llt(xtwx);
  if (llt.info() != Eigen::Success) {
    // add a small ridge and retry
    const double ridge
        = max(1e-12, 1e-8 * xtwx.diagonal().cwiseAbs().maxCoeff());
    xtwx.diagonal().array() += ridge;
    llt.compute(xtwx);
  }
  if (llt.info() == Eigen::Success)
    return llt.solve(xtwz);
  return Xw.colPivHouseholderQr().solve(zw);
}
}

MLEFit fit_logistic_mle(const Matrix &X, const IVector &y,
                        size_t max_iterations, Float tolerance) {
  validate_data(X, y);
  const Index N = X.rows();

  // start from mu = (y + 0.5) / 2, as binomial GLMs conventionally do
  Vector eta(N);
  for (Index n = 0; n < N; ++n) {
    const double mu = (y(n) + 0.5) / 2;
    eta(n) = log(mu / (1 - mu));
  }

  MLEFit fit = {Vector::Zero(X.cols()), deviance(X * Vector::Zero(X.cols()), y),
                0, false};
  Vector beta = fit.coefficients;
  double dev_old = fit.deviance;

  while (fit.iterations < max_iterations) {
    fit.iterations++;
    Vector beta_new = irls_step(X, y, eta);
    Vector eta_new = X * beta_new;
    double dev_new = deviance(eta_new, y);

    for (size_t k = 0; k < 30 and not(dev_new < dev_old); ++k) {
      beta_new = (beta + beta_new) / 2;
      eta_new = X * beta_new;
      dev_new = deviance(eta_new, y);
    }

    beta = beta_new;
    eta = eta_new;
    const double criterion = fabs(dev_new - dev_old) / (fabs(dev_new) + 0.1);
    LOG(debug) << "IRLS iteration " << fit.iterations
               << " deviance = " << dev_new << " criterion = " << criterion;
    dev_old = dev_new;
    if (criterion <= tolerance) {
      fit.converged = true;
      break;
    }
  }

  fit.coefficients = beta;
  fit.deviance = dev_old;
  if (not fit.coefficients.allFinite())
    throw Exception::NonFinite("the maximum-likelihood estimate");
  if (not fit.converged)
    LOG(warning) << "Warning: the maximum-likelihood fit did not converge "
                    "within "
                 << max_iterations << " iterations.";
  return fit;
}

ostream &operator<<(ostream &os, const MLEFit &fit) {
  os << "deviance = " << fit.deviance << " after " << fit.iterations
     << " iterations" << (fit.converged ? "" : " (not converged)");
  return os;
}
}
