#include "solvers/exhaustive_qubo_solver.h"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace mbo {

namespace {

/// Index of the lowest set bit of k (k > 0).
int lowest_set_bit(std::uint64_t k) {
    int i = 0;
    while ((k & 1u) == 0) {
        k >>= 1;
        ++i;
    }
    return i;
}

}  // namespace

ExhaustiveQuboSolver::ExhaustiveQuboSolver(Index max_variables)
    : max_variables_(max_variables) {
    if (max_variables < 1 || max_variables > 62) {
        throw std::invalid_argument(
            "ExhaustiveQuboSolver: max_variables must be in [1, 62], got " +
            std::to_string(max_variables));
    }
}

QuboSolution ExhaustiveQuboSolver::solve(const QuboInstance& qubo) {
    const Index n = qubo.num_variables();
    if (qubo.quadratic.rows() != n || qubo.quadratic.cols() != n) {
        throw SolverError(SolverErrorKind::kSolverFailure,
                          "ExhaustiveQuboSolver: quadratic term is " +
                              std::to_string(qubo.quadratic.rows()) + "x" +
                              std::to_string(qubo.quadratic.cols()) +
                              ", expected " + std::to_string(n) + "x" +
                              std::to_string(n));
    }
    if (n > max_variables_) {
        throw SolverError(SolverErrorKind::kSolverFailure,
                          "ExhaustiveQuboSolver: " + std::to_string(n) +
                              " variables exceeds the limit of " +
                              std::to_string(max_variables_));
    }

    // x'Qx only sees the symmetric part; the incremental update needs it.
    const MatrixXd q = 0.5 * (qubo.quadratic + qubo.quadratic.transpose());

    VectorXd x = VectorXd::Zero(n);
    VectorXd h = VectorXd::Zero(n);  // h = q x
    double value = qubo.constant;

    VectorXd best_x = x;
    double best_value = value;

    const std::uint64_t count = std::uint64_t{1} << n;
    for (std::uint64_t k = 1; k < count; ++k) {
        const int i = lowest_set_bit(k);
        const double d = (x(i) == 0.0) ? 1.0 : -1.0;

        value += d * (2.0 * h(i) + qubo.linear(i)) + q(i, i);
        h += d * q.col(i);
        x(i) += d;

        if (value < best_value) {
            best_value = value;
            best_x = x;
        }
    }

    QuboSolution solution;
    solution.x = best_x;
    // Re-evaluate to drop the drift accumulated by the incremental updates.
    solution.objective = qubo.value(best_x);
    return solution;
}

}  // namespace mbo
