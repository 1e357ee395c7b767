#include "pdist.hpp"
#include <cmath>

double log_normal(double x, double mu, double sigma) {
  double std_diff = (x - mu) / sigma;
  return -0.5 * log(2 * M_PI) - log(sigma) - 0.5 * std_diff * std_diff;
}
