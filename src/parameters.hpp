#ifndef PARAMETERS_HPP
#define PARAMETERS_HPP

#include <iostream>
#include <string>
#include "compression.hpp"
#include "types.hpp"

namespace BLR {

const std::string default_output_string = "THIS PATH SHOULD NOT EXIST";

struct Parameters {
  /** Chain length S, including the initial state */
  size_t num_iterations = 10000;
  /** Number of leading chain entries skipped for summaries and prediction */
  size_t burn_in = 2000;
  /** Standard deviation of the independent zero-mean normal prior */
  Float prior_sd = 10;
  /** Proposal covariance is this factor times (X^T X)^-1 */
  Float proposal_scale = 0.5;
  /** Interval for reporting the running acceptance rate; 0 disables it */
  size_t report_interval = 1000;

  /** Quality scores at or above this value are labeled 1 */
  Float threshold = 6.5;

  size_t mle_iterations = 50;
  Float mle_tolerance = 1e-8;

  /** Zero means a seed is drawn from the system's entropy pool */
  size_t seed = 0;

  CompressionMode compression_mode = CompressionMode::gzip;
  std::string output_directory = default_output_string;

  /** Throws Exception::InvalidArgument for settings that cannot be used */
  void validate() const;
};

std::ostream &operator<<(std::ostream &os, const Parameters &parameters);
}  // namespace BLR
#endif
