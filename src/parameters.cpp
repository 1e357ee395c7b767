#include "parameters.hpp"
#include <cmath>
#include "exceptions.hpp"

using namespace std;

namespace BLR {

void Parameters::validate() const {
  if (num_iterations < 2)
    throw Exception::InvalidArgument(
        "the chain length must be at least 2, but "
        + to_string(num_iterations) + " was requested.");
  if (not(prior_sd > 0) or not isfinite(prior_sd))
    throw Exception::InvalidArgument(
        "the prior standard deviation must be positive and finite.");
  if (not(proposal_scale >= 0) or not isfinite(proposal_scale))
    throw Exception::InvalidArgument(
        "the proposal scale must be non-negative and finite.");
}

ostream &operator<<(ostream &os, const Parameters &parameters) {
  os << "iterations = " << parameters.num_iterations << endl;
  os << "burn-in = " << parameters.burn_in << endl;
  os << "prior sd = " << parameters.prior_sd << endl;
  os << "proposal scale = " << parameters.proposal_scale << endl;
  os << "report interval = " << parameters.report_interval << endl;
  os << "threshold = " << parameters.threshold << endl;
  os << "seed = " << parameters.seed << endl;
  return os;
}
}  // namespace BLR
