#pragma once

/// @file qubo_solver.h
/// @brief QUBO instance and the binary-block solver port.
///
/// The engine only consumes a QUBO-solving capability. Exact enumeration,
/// simulated annealing, or a quantum-sampled backend all satisfy the same
/// contract: return a binary minimizer (or a heuristic one) of
///
///   f(x) = x' quadratic x + linear' x + constant,   x in {0,1}^n
///
/// or throw SolverError.

#include "core/errors.h"
#include "core/types.h"

namespace mbo {

/// Unconstrained binary quadratic program.
struct QuboInstance {
    MatrixXd quadratic;  ///< n x n; only its symmetric part matters.
    VectorXd linear;     ///< n.
    ScalarCPU constant = 0.0;

    Index num_variables() const { return static_cast<Index>(linear.size()); }

    /// Objective value at a 0/1 vector.
    ScalarCPU value(const VectorXd& x) const {
        return x.dot(quadratic * x) + linear.dot(x) + constant;
    }
};

/// Binary assignment returned by a QUBO solver.
struct QuboSolution {
    VectorXd x;                ///< Entries 0.0 or 1.0.
    ScalarCPU objective = 0.0; ///< QuboInstance::value(x).
};

/// Binary-block solver port.
class QuboSolver {
public:
    virtual ~QuboSolver() = default;

    /// Minimize the QUBO. A single blocking call; implementations may use
    /// threads internally.
    ///
    /// @throws SolverError (kInfeasible, kSolverFailure or kCancelled).
    virtual QuboSolution solve(const QuboInstance& qubo) = 0;
};

}  // namespace mbo
