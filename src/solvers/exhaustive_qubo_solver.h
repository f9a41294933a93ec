#pragma once

/// @file exhaustive_qubo_solver.h
/// @brief Exact QUBO solver by Gray-code enumeration.
///
/// Q is replaced by its symmetric part (Q + Q')/2 on entry. Visits all
/// 2^n assignments in Gray-code order so that consecutive
/// assignments differ in one bit. With h = Q x maintained incrementally,
/// flipping bit i by d = +/-1 changes the objective by
///
///   delta = d * (2 h_i + linear_i) + Q_ii
///
/// so each step costs O(n) and the whole search O(n 2^n).
/// Intended for small instances (tests, reference runs).

#include "solvers/qubo_solver.h"

namespace mbo {

class ExhaustiveQuboSolver : public QuboSolver {
public:
    /// @param max_variables Largest n accepted (default 24).
    explicit ExhaustiveQuboSolver(Index max_variables = 24);

    /// @throws SolverError(kSolverFailure) if n > max_variables or the
    ///         instance is malformed.
    QuboSolution solve(const QuboInstance& qubo) override;

    Index max_variables() const { return max_variables_; }

private:
    Index max_variables_;
};

}  // namespace mbo
