#ifndef POSTERIOR_HPP
#define POSTERIOR_HPP

#include "types.hpp"

namespace BLR {

/**
 * Check that a design matrix and a response vector belong together.
 *
 * Throws Exception::Dimension if the number of rows of X differs from the
 * length of y and Exception::InvalidArgument if y holds a label other than 0
 * or 1, or X holds a non-finite value.
 */
void validate_data(const Matrix &X, const IVector &y);

/**
 * Bernoulli log likelihood of a logistic regression model
 *
 * Returns negative infinity if beta or the linear predictor X * beta contain
 * non-finite values.
 */
Float log_likelihood(const Vector &beta, const Matrix &X, const IVector &y);

/** Independent zero-mean normal log prior with standard deviation sd */
Float log_prior(const Vector &beta, Float sd);

/**
 * Unnormalized log posterior density of the coefficients beta.
 *
 * Never returns NaN: degenerate input yields negative infinity, which
 * samplers treat as a rejection.
 */
Float log_posterior(const Vector &beta, const Matrix &X, const IVector &y,
                    Float prior_sd);
}

#endif
