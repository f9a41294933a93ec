#pragma once

/// @file problem_model.h
/// @brief Immutable mixed-binary constrained optimization (MBCO) instance.
///
/// Represents
///
///   min_{x, u}  x'Qx + a'x + u'Pu + c'u + constant
///   s.t.        G x = b                              (binary equalities)
///               A_ineq x <= b_ineq                   (g(x) <= 0)
///               Cx x + Cu u <= d                     (ell(x, u) <= 0)
///               x in {0,1}^n,  u_lower <= u <= u_upper
///
/// The binary domain is structural: no constraint rows encode it.
/// Quadratic forms are unscaled (no 1/2 factor). phi(u) = u'Pu + c'u must
/// be convex, i.e. P positive semidefinite.
///
/// References:
///   Gambella & Simonetto, "Multi-block ADMM Heuristics for Mixed-Binary
///   Optimization on Classical and Quantum Computers", IEEE TQE, 2020.

#include <string>
#include <vector>

#include "core/types.h"

namespace mbo {

struct ProblemModel {
    // Binary objective q(x) = x'Qx + a'x.
    MatrixXd Q;
    VectorXd a;

    // Continuous objective phi(u) = u'Pu + c'u.
    MatrixXd P;
    VectorXd c;

    ScalarCPU constant = 0.0;  ///< Objective offset.

    // Binary equality constraints G x = b (penalized in the QUBO).
    MatrixXd G;
    VectorXd b;

    // Binary inequality constraints A_ineq x <= b_ineq.
    MatrixXd A_ineq;
    VectorXd b_ineq;

    // Coupling constraints coupling_x x + coupling_u u <= coupling_rhs.
    MatrixXd coupling_x;
    MatrixXd coupling_u;
    VectorXd coupling_rhs;

    // Continuous domain U (entries may be +/-kInf).
    VectorXd u_lower;
    VectorXd u_upper;

    // Optional variable labels, used by the report writer.
    std::vector<std::string> binary_names;
    std::vector<std::string> continuous_names;

    /// Number of binary variables.
    Index n() const { return static_cast<Index>(a.size()); }

    /// Number of continuous variables.
    Index l() const { return static_cast<Index>(c.size()); }

    Index num_equalities() const { return static_cast<Index>(b.size()); }
    Index num_inequalities() const { return static_cast<Index>(b_ineq.size()); }
    Index num_coupling() const { return static_cast<Index>(coupling_rhs.size()); }

    /// Check the structural assumptions the decomposition relies on.
    ///
    /// Checks:
    ///   - n >= 1, Q is n x n and symmetric
    ///   - P is l x l, symmetric and positive semidefinite
    ///   - G/b, A_ineq/b_ineq, coupling blocks have matching dimensions
    ///   - u_lower <= u_upper (U non-empty)
    ///   - all objective and constraint data finite
    ///
    /// @throws MalformedProblem naming the violated assumption.
    void validate() const;

    /// q(x) = x'Qx + a'x.
    ScalarCPU binary_objective(const VectorXd& x) const;

    /// phi(u) = u'Pu + c'u. Returns 0 when l = 0.
    ScalarCPU continuous_objective(const VectorXd& u) const;

    /// Unpenalized objective q(x) + phi(u) + constant.
    ScalarCPU objective(const VectorXd& x, const VectorXd& u) const;

    /// Total constraint violation at (x, u).
    ///
    /// Sum of |G x - b|, positive parts of A_ineq x - b_ineq and of the
    /// coupling rows, and of the bound violations of u. Integrality of x
    /// is not measured.
    ScalarCPU constraint_violation(const VectorXd& x, const VectorXd& u) const;

    /// True if constraint_violation(x, u) <= tol.
    bool is_feasible(const VectorXd& x, const VectorXd& u,
                     ScalarCPU tol = 1e-6) const;
};

}  // namespace mbo
