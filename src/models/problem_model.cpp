#include "models/problem_model.h"

#include <algorithm>
#include <cmath>

#include <Eigen/Eigenvalues>

#include "core/errors.h"

namespace mbo {

namespace {

std::string shape(const MatrixXd& m) {
    return std::to_string(m.rows()) + "x" + std::to_string(m.cols());
}

/// A constraint block with zero rows (or zero columns) may be left empty.
void check_block(const char* name, const MatrixXd& m, Index rows, Index cols) {
    if ((rows == 0 || cols == 0) && m.size() == 0) return;
    if (m.rows() != rows || m.cols() != cols) {
        throw MalformedProblem(std::string(name) + " is " + shape(m) +
                               ", expected " + std::to_string(rows) + "x" +
                               std::to_string(cols));
    }
}

void check_finite(const char* name, const MatrixXd& m) {
    if (m.size() > 0 && !m.allFinite()) {
        throw MalformedProblem(std::string(name) + " has non-finite entries");
    }
}

void check_symmetric(const char* name, const MatrixXd& m) {
    const double scale = std::max(1.0, m.cwiseAbs().maxCoeff());
    const double asym = (m - m.transpose()).cwiseAbs().maxCoeff();
    if (asym > 1e-9 * scale) {
        throw MalformedProblem(std::string(name) +
                               " is not symmetric (max |M - M'| = " +
                               std::to_string(asym) + ")");
    }
}

/// Sum of positive parts of (lhs - rhs).
double excess(const VectorXd& lhs, const VectorXd& rhs) {
    return (lhs - rhs).cwiseMax(0.0).sum();
}

}  // namespace

void ProblemModel::validate() const {
    const Index nb = n();
    const Index nc = l();

    if (nb < 1) {
        throw MalformedProblem("no binary variables (a is empty)");
    }
    check_block("Q", Q, nb, nb);
    check_finite("Q", Q);
    check_finite("a", a);
    check_symmetric("Q", Q);

    check_block("P", P, nc, nc);
    check_finite("P", P);
    check_finite("c", c);
    if (nc > 0) {
        check_symmetric("P", P);
        Eigen::SelfAdjointEigenSolver<MatrixXd> eig(P, Eigen::EigenvaluesOnly);
        const double min_eig = eig.eigenvalues().minCoeff();
        const double scale =
            std::max(1.0, eig.eigenvalues().cwiseAbs().maxCoeff());
        if (min_eig < -1e-9 * scale) {
            throw MalformedProblem(
                "P is not positive semidefinite (min eigenvalue " +
                std::to_string(min_eig) + "), phi(u) is not convex");
        }
    }
    if (!std::isfinite(constant)) {
        throw MalformedProblem("objective constant is not finite");
    }

    check_block("G", G, num_equalities(), nb);
    check_finite("G", G);
    check_finite("b", b);

    check_block("A_ineq", A_ineq, num_inequalities(), nb);
    check_finite("A_ineq", A_ineq);
    check_finite("b_ineq", b_ineq);

    check_block("coupling_x", coupling_x, num_coupling(), nb);
    check_block("coupling_u", coupling_u, num_coupling(), nc);
    check_finite("coupling_x", coupling_x);
    check_finite("coupling_u", coupling_u);
    check_finite("coupling_rhs", coupling_rhs);

    if (u_lower.size() != nc || u_upper.size() != nc) {
        throw MalformedProblem(
            "bounds of U have sizes " + std::to_string(u_lower.size()) +
            "/" + std::to_string(u_upper.size()) + ", expected " +
            std::to_string(nc));
    }
    for (Index j = 0; j < nc; ++j) {
        if (std::isnan(u_lower(j)) || std::isnan(u_upper(j)) ||
            u_lower(j) > u_upper(j) || u_lower(j) == kInf ||
            u_upper(j) == -kInf) {
            throw MalformedProblem(
                "U is empty: u_lower[" + std::to_string(j) + "] = " +
                std::to_string(u_lower(j)) + ", u_upper[" +
                std::to_string(j) + "] = " + std::to_string(u_upper(j)));
        }
    }

    if (!binary_names.empty() &&
        static_cast<Index>(binary_names.size()) != nb) {
        throw MalformedProblem("binary_names has " +
                               std::to_string(binary_names.size()) +
                               " entries, expected " + std::to_string(nb));
    }
    if (!continuous_names.empty() &&
        static_cast<Index>(continuous_names.size()) != nc) {
        throw MalformedProblem("continuous_names has " +
                               std::to_string(continuous_names.size()) +
                               " entries, expected " + std::to_string(nc));
    }
}

ScalarCPU ProblemModel::binary_objective(const VectorXd& x) const {
    return x.dot(Q * x) + a.dot(x);
}

ScalarCPU ProblemModel::continuous_objective(const VectorXd& u) const {
    if (l() == 0) return 0.0;
    return u.dot(P * u) + c.dot(u);
}

ScalarCPU ProblemModel::objective(const VectorXd& x, const VectorXd& u) const {
    return binary_objective(x) + continuous_objective(u) + constant;
}

ScalarCPU ProblemModel::constraint_violation(const VectorXd& x,
                                             const VectorXd& u) const {
    double violation = 0.0;
    if (num_equalities() > 0) {
        violation += (G * x - b).cwiseAbs().sum();
    }
    if (num_inequalities() > 0) {
        violation += excess(A_ineq * x, b_ineq);
    }
    if (num_coupling() > 0) {
        VectorXd lhs = coupling_x * x;
        if (l() > 0) lhs += coupling_u * u;
        violation += excess(lhs, coupling_rhs);
    }
    if (l() > 0) {
        violation += excess(u_lower, u) + excess(u, u_upper);
    }
    return violation;
}

bool ProblemModel::is_feasible(const VectorXd& x, const VectorXd& u,
                               ScalarCPU tol) const {
    return constraint_violation(x, u) <= tol;
}

}  // namespace mbo
