#ifndef TYPES_HPP
#define TYPES_HPP

#include <cstdint>
#include <eigen3/Eigen/Dense>

namespace BLR {
using Int = uint32_t;
using Float = double;
using Index = Eigen::MatrixXd::Index;
using Vector = Eigen::VectorXd;
using IVector = Eigen::Matrix<Int, Eigen::Dynamic, 1>;
using Matrix = Eigen::MatrixXd;
}

#endif
