#include "proposal.hpp"
#include <cmath>
#include "exceptions.hpp"
#include "log.hpp"
#include "sampling.hpp"

using namespace std;

namespace BLR {

Matrix proposal_covariance(const Matrix &X, Float scale) {
  if (not(scale >= 0) or not isfinite(scale))
    throw Exception::InvalidArgument(
        "the proposal scale must be non-negative and finite.");
  const Index P = X.cols();
  const Matrix xtx = X.transpose() * X;
  Eigen::LLT<Matrix> llt(xtx);
  if (llt.info() != Eigen::Success)
    throw Exception::NotPositiveDefinite(
        "the cross product X^T X of the design matrix");
  Matrix inv = llt.solve(Matrix::Identity(P, P));
  // symmetrize to remove rounding asymmetry of the solve
  inv = (inv + inv.transpose()) / 2;
  return scale * inv;
}

Proposal::Proposal(const Matrix &covariance) : cov(covariance), factor() {
  const Index P = cov.rows();
  if (P == 0)
    throw Exception::InvalidArgument("the proposal covariance is empty.");
  if (cov.cols() != P)
    throw Exception::Dimension("number of columns of the proposal covariance",
                               P, cov.cols());
  if (not cov.allFinite())
    throw Exception::NonFinite("the proposal covariance");

  const double max_abs = cov.cwiseAbs().maxCoeff();
  const double tol = 1e-10 * max(max_abs, 1.0);
  if ((cov - cov.transpose()).cwiseAbs().maxCoeff() > tol)
    throw Exception::InvalidArgument("the proposal covariance is not symmetric.");

  // LDLT with pivoting copes with semi-definite matrices:
  // cov = P^T L D L^T P, hence factor = P^T L D^(1/2)
  Eigen::LDLT<Matrix> ldlt(cov);
  if (ldlt.info() != Eigen::Success)
    throw Exception::NotPositiveDefinite("the proposal covariance");
  Vector d = ldlt.vectorD();
  for (Index i = 0; i < P; ++i) {
    if (d(i) < -tol)
      throw Exception::NotPositiveDefinite("the proposal covariance");
    d(i) = d(i) > 0 ? sqrt(d(i)) : 0;
  }
  const Matrix L = ldlt.matrixL();
  Matrix perm = Matrix::Identity(P, P);
  perm = ldlt.transpositionsP() * perm;
  factor = perm.transpose() * L * d.asDiagonal();
  LOG(debug) << "Proposal covariance factor:\n" << factor;
}

Vector Proposal::propose(const Vector &current, RNG &rng) const {
  if (current.size() != dim())
    throw Exception::Dimension("length of the current state", dim(),
                               current.size());
  return sample_multivariate_normal(current, factor, rng);
}
}
