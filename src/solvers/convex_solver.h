#pragma once

/// @file convex_solver.h
/// @brief Convex QP instance and the continuous-block solver port.
///
/// Instances have the form
///
///   min_w  0.5 w'Hw + f'w + constant
///   s.t.   row_lower <= A w <= row_upper
///          lower <= w <= upper
///
/// with H positive semidefinite. Infinite entries in the bound vectors
/// mark unbounded sides.

#include "core/errors.h"
#include "core/types.h"

namespace mbo {

/// Convex quadratic program handed to a ConvexSolver.
struct ConvexInstance {
    MatrixXd H;
    VectorXd f;
    ScalarCPU constant = 0.0;

    MatrixXd A;          ///< m x dim; may be empty (m = 0).
    VectorXd row_lower;
    VectorXd row_upper;

    VectorXd lower;      ///< Variable bounds (dim).
    VectorXd upper;

    Index dimension() const { return static_cast<Index>(f.size()); }
    Index num_rows() const { return static_cast<Index>(row_lower.size()); }

    /// 0.5 w'Hw + f'w + constant.
    ScalarCPU objective(const VectorXd& w) const {
        return 0.5 * w.dot(H * w) + f.dot(w) + constant;
    }

    /// Largest violation of any row or variable bound at w (0 if feasible).
    ScalarCPU max_violation(const VectorXd& w) const;
};

/// Continuous point returned by a convex solver.
struct ConvexSolution {
    VectorXd w;
    ScalarCPU objective = 0.0;  ///< ConvexInstance::objective(w).
};

/// Continuous-block solver port.
class ConvexSolver {
public:
    virtual ~ConvexSolver() = default;

    /// Solve the convex instance to optimality.
    ///
    /// @throws SolverError (kInfeasible, kSolverFailure or kCancelled).
    virtual ConvexSolution solve(const ConvexInstance& qp) = 0;
};

}  // namespace mbo
