#pragma once

/// @file admm_engine.h
/// @brief Multi-block ADMM heuristic for mixed-binary constrained problems.
///
/// Solves the MBCO of ProblemModel by alternating
///   x-update: QUBO over the binaries (QuboSolver port)
///   (z, u)-update: convex QP over the relaxed copy and the continuous
///                  variables (ConvexSolver port), or a closed form for z
///   s-update: closed-form consensus slack (3-block only)
///   y-update: y += rho (x - z - s)
/// until the consensus residual ||x - z - s|| drops below tol.
///
/// The 3-block schedule converges for rho large enough relative to beta
/// (Gambella & Simonetto, Theorem 2); the 2-block schedule drops the slack
/// and is a heuristic. With a large rho it can settle on a feasible
/// non-optimal x, since leaving it costs about rho / 2 per flipped bit.
///
/// The engine holds no global state. Independent problems can be solved
/// concurrently on independent engines, provided each has its own ports.
///
/// References:
///   Gambella & Simonetto, "Multi-block ADMM Heuristics for Mixed-Binary
///   Optimization on Classical and Quantum Computers", IEEE TQE, 2020.
///   Boyd et al., "Distributed Optimization and Statistical Learning
///   via the Alternating Direction Method of Multipliers", 2011.
///   - Residual balancing: Section 3.4.1, Eq. (3.13)

#include "models/problem_model.h"
#include "optimizer/admm_params.h"
#include "optimizer/iterate_state.h"
#include "optimizer/result_assembler.h"
#include "optimizer/subproblem_builder.h"
#include "solvers/convex_solver.h"
#include "solvers/qubo_solver.h"

namespace mbo {

/// Schedule tags, selected once at construction.
struct TwoBlockSchedule {};
struct ThreeBlockSchedule {};

class AdmmEngine {
public:
    /// The problem and parameters are copied and validated; the ports are
    /// held by reference and must outlive the engine.
    ///
    /// @throws MalformedProblem if the problem fails validation.
    /// @throws std::invalid_argument if the parameters fail validation.
    AdmmEngine(ProblemModel problem, AdmmParams params,
               QuboSolver& qubo_solver, ConvexSolver& convex_solver);

    AdmmEngine(const AdmmEngine&) = delete;
    AdmmEngine& operator=(const AdmmEngine&) = delete;

    /// Cold start: x, z, s, y zero, u = clamp(0, U), rho = rho_initial.
    IterateState initial_state() const;

    /// One ADMM pass (x, then (z, u), then s, then y; residuals; rho).
    ///
    /// @throws SubproblemFailure if a port fails or returns an invalid
    ///         answer.
    IterateState step(IterateState state);

    /// Run from initial_state().
    ///
    /// @throws SubproblemFailure if a port fails.
    AdmmResult solve();

    /// Run from a caller-supplied iterate (warm start). rho is clamped
    /// into [rho_min, rho_max]; in 2-block mode s is reset to zero.
    ///
    /// @throws std::invalid_argument if the state has the wrong shape or a
    ///         non-binary x.
    /// @throws SubproblemFailure if a port fails.
    AdmmResult solve(IterateState initial);

    const ProblemModel& problem() const { return problem_; }
    const AdmmParams& params() const { return params_; }

private:
    template <typename Schedule>
    IterateState step_impl(IterateState state);

    template <typename Schedule>
    AdmmResult run_loop(IterateState state);

    void update_slack(IterateState& state, TwoBlockSchedule) const;
    void update_slack(IterateState& state, ThreeBlockSchedule) const;

    VectorXd solve_binary(const IterateState& state);
    void solve_continuous(IterateState& state);
    ScalarCPU next_rho(ScalarCPU rho, ScalarCPU primal, ScalarCPU dual) const;

    ProblemModel problem_;
    AdmmParams params_;
    SubproblemBuilder builder_;
    QuboSolver& qubo_solver_;
    ConvexSolver& convex_solver_;

    IterateState (AdmmEngine::*step_fn_)(IterateState);
    AdmmResult (AdmmEngine::*run_fn_)(IterateState);
};

}  // namespace mbo
