#ifndef EXCEPTIONS_HPP
#define EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

namespace BLR {
namespace Exception {
/** Raised when two objects that must agree in size do not */
struct Dimension : public std::invalid_argument {
  Dimension(const std::string &what, size_t expected, size_t actual)
      : std::invalid_argument("Error: dimension mismatch for " + what
                              + ": expected " + std::to_string(expected)
                              + " but got " + std::to_string(actual) + "."),
        expected(expected),
        actual(actual){};
  size_t expected;
  size_t actual;
};
struct InvalidArgument : public std::invalid_argument {
  InvalidArgument(const std::string &what)
      : std::invalid_argument("Error: " + what){};
};
struct NotPositiveDefinite : public std::invalid_argument {
  NotPositiveDefinite(const std::string &what)
      : std::invalid_argument("Error: " + what
                              + " is not positive definite."){};
};
struct NonFinite : public std::runtime_error {
  NonFinite(const std::string &what)
      : std::runtime_error("Error: non-finite value in " + what + "."){};
};
/** The score of the current state of a chain is not finite */
struct CorruptedChain : public std::runtime_error {
  CorruptedChain(double score)
      : std::runtime_error(
            "Error: chain corrupted; the current state has the non-finite "
            "score "
            + std::to_string(score) + "."),
        score(score){};
  double score;
};
}
}

#endif
