#pragma once

/// @file subproblem_builder.h
/// @brief Builds the per-iteration ADMM subproblems from the current iterate.
///
/// With the consensus constraint x = z + s and unscaled multipliers y, the
/// augmented Lagrangian of Gambella & Simonetto (2020), Eq. (9), is
///
///   L = q(x) + (c/2)||Gx - b||^2 + phi(u) + (beta/2)||s||^2
///       + y'(x - z - s) + (rho/2)||x - z - s||^2
///
/// restricted to z in [0,1]^n, A_ineq z <= b_ineq, Cx z + Cu u <= d, u in U.
/// Each block minimizes L over its own variables with the others fixed:
///
///   x-block (QUBO):   Q + (c/2)G'G + (rho/2)I,   a - c G'b + y - rho(z + s)
///   (z, u)-block:     0.5 w'Hw + f'w with H = diag(rho I, 2P),
///                     f = [-y - rho(x - s); c]
///   s-block:          s = (y + rho(x - z)) / (beta + rho)
///
/// Quadratic and linear parts that do not depend on the iterate are
/// precomputed once.
///
/// References:
///   Gambella & Simonetto, "Multi-block ADMM Heuristics for Mixed-Binary
///   Optimization on Classical and Quantum Computers", IEEE TQE, 2020.
///   - Algorithm 1 (3-block schedule), Eq. (12)-(15) (block updates).

#include "core/types.h"
#include "models/problem_model.h"
#include "optimizer/admm_params.h"
#include "optimizer/iterate_state.h"
#include "solvers/convex_solver.h"
#include "solvers/qubo_solver.h"

namespace mbo {

class SubproblemBuilder {
public:
    /// Validates both inputs and keeps references to them; they must
    /// outlive the builder.
    ///
    /// @throws MalformedProblem if the problem fails validation.
    /// @throws std::invalid_argument if the parameters fail validation.
    SubproblemBuilder(const ProblemModel& problem, const AdmmParams& params);

    /// Binary subproblem at the current (z, s, y, rho).
    QuboInstance build_qubo(const IterateState& state) const;

    /// Continuous subproblem at the current (x, s, y, rho).
    ///
    /// Variables are [z; u] in general and [u] alone when
    /// has_closed_form_consensus() is true.
    ConvexInstance build_convex(const IterateState& state) const;

    /// True when no inequality or coupling row involves z, so z decouples
    /// from u and has a closed form.
    bool has_closed_form_consensus() const { return closed_form_; }

    /// z = clamp(x - s + y / rho, 0, 1).
    VectorXd closed_form_consensus(const IterateState& state) const;

    /// Third block: s = (y + rho (x - z)) / (beta + rho).
    VectorXd update_slack(const IterateState& state) const;

    /// Number of leading z entries in the convex variable vector
    /// (0 on the closed-form path, n otherwise).
    Index convex_z_size() const { return closed_form_ ? 0 : problem_.n(); }

private:
    const ProblemModel& problem_;
    const AdmmParams& params_;
    bool closed_form_ = false;

    // Iterate-independent parts of the QUBO.
    MatrixXd qubo_quadratic_;
    VectorXd qubo_linear_;
    ScalarCPU qubo_constant_ = 0.0;
};

}  // namespace mbo
