#pragma once

/// @file types.h
/// @brief Fundamental type aliases for the mixed-binary optimizer.
///
/// Everything runs in double precision on the CPU; binary assignments are
/// stored as VectorXd with entries exactly 0.0 or 1.0 so they mix freely
/// with the continuous iterates in Eigen expressions.

#include <limits>

#include <Eigen/Core>

namespace mbo {

/// Scalar type for all iterates and problem data.
using ScalarCPU = double;

/// Integer index type used throughout the library.
using Index = int;

using VectorXd = Eigen::VectorXd;
using MatrixXd = Eigen::MatrixXd;

/// Shorthand for an unbounded variable or constraint side.
constexpr ScalarCPU kInf = std::numeric_limits<ScalarCPU>::infinity();

}  // namespace mbo
