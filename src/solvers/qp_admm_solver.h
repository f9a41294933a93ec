#pragma once

/// @file qp_admm_solver.h
/// @brief Dense OSQP-style ADMM solver for convex QPs, with polishing.
///
/// Solves the ConvexInstance
///
///   min 0.5 w'Hw + f'w   s.t.  l <= Abar w <= u,   Abar = [A; I]
///
/// by the operator splitting of Stellato et al.:
///   w~  = (H + sigma I + rho Abar'Abar)^{-1} (sigma w - f + Abar'(rho z - y))
///   w   = alpha w~ + (1 - alpha) w
///   z   = clamp(alpha Abar w~ + (1 - alpha) z + y / rho, l, u)
///   y  += rho (alpha Abar w~ + (1 - alpha) z_prev - z)
///
/// The normalized residual ratio drives rho (refactorizing the LDLT when it
/// moves by more than adaptive_rho_tolerance). Consecutive dual iterates
/// give a primal infeasibility certificate. After convergence the active
/// set guessed from (z, y) defines a reduced KKT system whose solution,
/// if it satisfies the KKT sign and feasibility conditions, replaces the
/// ADMM iterate ("polish").
///
/// References:
///   Stellato, Banjac, Goulart, Bemporad, Boyd, "OSQP: An Operator
///   Splitting Solver for Quadratic Programs", Math. Prog. Comp., 2020.
///   - Algorithm 1 (iteration), Section 3.4 (termination),
///     Section 3.4 / Eq. (29) (primal infeasibility), Section 4 (polish),
///     Section 5.2 (rho selection).

#include "solvers/convex_solver.h"

namespace mbo {

/// Settings for QpAdmmSolver.
struct QpAdmmSettings {
    ScalarCPU rho = 0.1;              ///< Initial ADMM step size.
    ScalarCPU rho_min = 1e-6;
    ScalarCPU rho_max = 1e6;
    ScalarCPU sigma = 1e-6;           ///< Primal regularization.
    ScalarCPU alpha = 1.6;            ///< Over-relaxation in (0, 2).
    int max_iter = 20000;
    int check_interval = 10;          ///< Iterations between termination checks.
    ScalarCPU eps_abs = 1e-9;
    ScalarCPU eps_rel = 1e-9;
    ScalarCPU eps_prim_inf = 1e-6;    ///< Infeasibility certificate tolerance.
    bool adaptive_rho = true;
    ScalarCPU adaptive_rho_tolerance = 5.0;
    bool polish = true;
    ScalarCPU polish_delta = 1e-9;    ///< KKT regularization for polishing.
    int polish_refine_iter = 5;       ///< Iterative refinement passes.
    ScalarCPU polish_tolerance = 1e-8;
    /// Wall-clock limit per solve; exceeding it throws kCancelled.
    ScalarCPU max_time_seconds = kInf;
};

/// Diagnostics of the last solve() call.
struct QpAdmmInfo {
    int iterations = 0;
    bool converged = false;  ///< ADMM met eps_abs/eps_rel.
    bool polished = false;   ///< Polished solution accepted.
    ScalarCPU primal_residual = 0.0;
    ScalarCPU dual_residual = 0.0;
    ScalarCPU rho = 0.0;     ///< Final step size.
};

class QpAdmmSolver : public ConvexSolver {
public:
    explicit QpAdmmSolver(QpAdmmSettings settings = {});

    /// @throws SolverError kInfeasible on a primal infeasibility
    ///         certificate, kSolverFailure on malformed input or when
    ///         neither ADMM nor polishing reaches the tolerance,
    ///         kCancelled past max_time_seconds.
    ConvexSolution solve(const ConvexInstance& qp) override;

    const QpAdmmSettings& settings() const { return settings_; }

    /// Diagnostics of the most recent solve().
    const QpAdmmInfo& last_info() const { return info_; }

private:
    QpAdmmSettings settings_;
    QpAdmmInfo info_;
};

}  // namespace mbo
