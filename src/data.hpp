#ifndef DATA_HPP
#define DATA_HPP

#include <iostream>
#include <string>
#include <vector>
#include "types.hpp"

namespace BLR {

const std::string intercept_label = "(Intercept)";

/** Named numeric columns of a delimited text file */
struct Table {
  std::vector<std::string> col_names;
  Matrix values;
};

/**
 * Read a table with a header line of column names, which may be quoted.
 *
 * Throws Exception::File::Parsing if a row has a different number of fields
 * than the header or a field is not numeric.
 */
Table read_table(std::istream &is, const std::string &separator,
                 const std::string &source = "input");

/**
 * Design matrix and binary response of a logistic regression problem.
 *
 * Column 0 of the design is all ones; column j > 0 holds covariate j - 1
 * centered by means[j - 1] and scaled by sds[j - 1].
 */
struct Data {
  Matrix design;
  IVector response;
  std::vector<std::string> covariate_names;
  Vector means;
  Vector sds;

  size_t num_observations() const { return design.rows(); }
  size_t num_covariates() const { return covariate_names.size(); }

  /** Intercept label followed by the covariate names */
  std::vector<std::string> coefficient_names() const;

  /** Map raw covariate values to a design row, including the leading 1 */
  Vector standardize(const Vector &raw) const;

  /**
   * Design row of a new observation given as comma-separated raw covariate
   * values; an empty string stands for the covariate means.
   *
   * Throws std::invalid_argument for non-numeric values and
   * Exception::Dimension if the number of values is not num_covariates().
   */
  Vector new_observation(const std::string &values) const;
};

/**
 * Build the design matrix from all columns but the response column and label
 * rows 1 whose response is at least threshold.
 */
Data build_data(const Table &table, const std::string &response_column,
                double threshold);

/** Read a possibly compressed table from path and build the data from it */
Data load_data(const std::string &path, const std::string &separator,
               const std::string &response_column, double threshold);

std::ostream &operator<<(std::ostream &os, const Data &data);
}

#endif
