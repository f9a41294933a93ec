#include "optimizer/admm_engine.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include <spdlog/spdlog.h>

#include "core/errors.h"
#include "optimizer/residual_tracker.h"
#include "utils/timer.h"

namespace mbo {

const char* to_string(EngineStatus status) {
    switch (status) {
        case EngineStatus::kInitialized: return "INITIALIZED";
        case EngineStatus::kIterating: return "ITERATING";
        case EngineStatus::kConverged: return "CONVERGED";
        case EngineStatus::kMaxIterReached: return "MAX_ITER_REACHED";
        case EngineStatus::kTimeLimitReached: return "TIME_LIMIT_REACHED";
    }
    return "UNKNOWN";
}

namespace {

constexpr double kBinaryTol = 1e-9;

void check_size(const char* name, const VectorXd& v, Index expected) {
    if (v.size() != expected) {
        throw std::invalid_argument(
            std::string("AdmmEngine: initial ") + name + " has size " +
            std::to_string(v.size()) + ", expected " +
            std::to_string(expected));
    }
    if (!v.allFinite()) {
        throw std::invalid_argument(
            std::string("AdmmEngine: initial ") + name +
            " has non-finite entries");
    }
}

/// Snap entries within kBinaryTol of 0 or 1; false if any entry is neither.
bool snap_binary(VectorXd& x) {
    for (Index i = 0; i < x.size(); ++i) {
        if (std::abs(x(i)) <= kBinaryTol) {
            x(i) = 0.0;
        } else if (std::abs(x(i) - 1.0) <= kBinaryTol) {
            x(i) = 1.0;
        } else {
            return false;
        }
    }
    return true;
}

}  // namespace

AdmmEngine::AdmmEngine(ProblemModel problem, AdmmParams params,
                       QuboSolver& qubo_solver, ConvexSolver& convex_solver)
    : problem_(std::move(problem)),
      params_(params),
      builder_(problem_, params_),
      qubo_solver_(qubo_solver),
      convex_solver_(convex_solver) {
    if (params_.three_block) {
        step_fn_ = &AdmmEngine::step_impl<ThreeBlockSchedule>;
        run_fn_ = &AdmmEngine::run_loop<ThreeBlockSchedule>;
    } else {
        step_fn_ = &AdmmEngine::step_impl<TwoBlockSchedule>;
        run_fn_ = &AdmmEngine::run_loop<TwoBlockSchedule>;
    }
}

IterateState AdmmEngine::initial_state() const {
    const Index n = problem_.n();
    const Index l = problem_.l();

    IterateState state;
    state.x = VectorXd::Zero(n);
    state.z = VectorXd::Zero(n);
    state.s = VectorXd::Zero(n);
    state.y = VectorXd::Zero(n);
    state.u = VectorXd::Zero(l);
    if (l > 0) {
        state.u = state.u.cwiseMax(problem_.u_lower).cwiseMin(problem_.u_upper);
    }
    state.rho = params_.rho_initial;
    state.iteration = 0;
    state.status = EngineStatus::kInitialized;
    return state;
}

IterateState AdmmEngine::step(IterateState state) {
    check_size("x", state.x, problem_.n());
    check_size("z", state.z, problem_.n());
    check_size("s", state.s, problem_.n());
    check_size("y", state.y, problem_.n());
    check_size("u", state.u, problem_.l());
    if (!(state.rho > 0.0)) {
        throw std::invalid_argument("AdmmEngine::step: rho must be > 0");
    }
    return (this->*step_fn_)(std::move(state));
}

AdmmResult AdmmEngine::solve() {
    return (this->*run_fn_)(initial_state());
}

AdmmResult AdmmEngine::solve(IterateState initial) {
    check_size("x", initial.x, problem_.n());
    check_size("z", initial.z, problem_.n());
    check_size("s", initial.s, problem_.n());
    check_size("y", initial.y, problem_.n());
    check_size("u", initial.u, problem_.l());
    if (!snap_binary(initial.x)) {
        throw std::invalid_argument("AdmmEngine: initial x is not binary");
    }
    if (!params_.three_block) {
        initial.s.setZero();
    }
    initial.rho = std::clamp(initial.rho, params_.rho_min, params_.rho_max);
    initial.iteration = 0;
    initial.status = EngineStatus::kInitialized;
    return (this->*run_fn_)(std::move(initial));
}

// ── Block updates ───────────────────────────────────────────────────

VectorXd AdmmEngine::solve_binary(const IterateState& state) {
    const QuboInstance qubo = builder_.build_qubo(state);

    QuboSolution sol;
    try {
        sol = qubo_solver_.solve(qubo);
    } catch (const SolverError& e) {
        throw SubproblemFailure(state.iteration, SubproblemBlock::kBinary,
                                e.kind(), e.what());
    }

    if (sol.x.size() != problem_.n()) {
        throw SubproblemFailure(
            state.iteration, SubproblemBlock::kBinary,
            SolverErrorKind::kSolverFailure,
            "QUBO solution has size " + std::to_string(sol.x.size()) +
                ", expected " + std::to_string(problem_.n()));
    }
    if (!snap_binary(sol.x)) {
        throw SubproblemFailure(state.iteration, SubproblemBlock::kBinary,
                                SolverErrorKind::kSolverFailure,
                                "QUBO solution is not binary");
    }
    return sol.x;
}

void AdmmEngine::solve_continuous(IterateState& state) {
    const Index n = problem_.n();
    const Index l = problem_.l();
    const Index nz = builder_.convex_z_size();

    if (builder_.has_closed_form_consensus()) {
        state.z = builder_.closed_form_consensus(state);
        if (l == 0) return;
    }

    const ConvexInstance qp = builder_.build_convex(state);
    ConvexSolution sol;
    try {
        sol = convex_solver_.solve(qp);
    } catch (const SolverError& e) {
        throw SubproblemFailure(state.iteration, SubproblemBlock::kContinuous,
                                e.kind(), e.what());
    }

    if (sol.w.size() != nz + l) {
        throw SubproblemFailure(
            state.iteration, SubproblemBlock::kContinuous,
            SolverErrorKind::kSolverFailure,
            "convex solution has size " + std::to_string(sol.w.size()) +
                ", expected " + std::to_string(nz + l));
    }
    if (!sol.w.allFinite()) {
        throw SubproblemFailure(state.iteration, SubproblemBlock::kContinuous,
                                SolverErrorKind::kSolverFailure,
                                "convex solution has non-finite entries");
    }

    if (nz > 0) {
        // Remove solver round-off outside the box.
        state.z = sol.w.head(n).cwiseMax(0.0).cwiseMin(1.0);
    }
    if (l > 0) {
        state.u = sol.w.tail(l);
    }
}

void AdmmEngine::update_slack(IterateState& /*state*/, TwoBlockSchedule) const {}

void AdmmEngine::update_slack(IterateState& state, ThreeBlockSchedule) const {
    state.s = builder_.update_slack(state);
}

ScalarCPU AdmmEngine::next_rho(ScalarCPU rho, ScalarCPU primal,
                               ScalarCPU dual) const {
    switch (params_.rho_policy) {
        case RhoPolicy::kFixed:
            break;
        case RhoPolicy::kGrowTenPercent:
            rho *= params_.rho_growth;
            break;
        case RhoPolicy::kResidualBalancing:
            // Boyd 2011, Eq. (3.13). y is unscaled, so it needs no rescaling.
            if (primal > params_.mu_res * dual) {
                rho *= params_.tau_incr;
            } else if (dual > params_.mu_res * primal) {
                rho /= params_.tau_decr;
            }
            break;
    }
    return std::clamp(rho, params_.rho_min, params_.rho_max);
}

// ── One pass ────────────────────────────────────────────────────────

template <typename Schedule>
IterateState AdmmEngine::step_impl(IterateState state) {
    const VectorXd z_prev = state.z;

    // 1. Binary block.
    state.x = solve_binary(state);

    // 2. Continuous block (z, u).
    solve_continuous(state);

    // 3. Consensus slack (3-block only).
    update_slack(state, Schedule{});

    // 4. Dual update.
    const VectorXd r = state.x - state.z - state.s;
    state.y += state.rho * r;

    // 5. Residuals.
    state.primal_residual = r.norm();
    state.dual_residual = state.rho * (state.z - z_prev).norm();
    state.constraint_residual =
        problem_.constraint_violation(state.x, state.u);
    state.objective = problem_.objective(state.x, state.u);
    state.merit = state.objective + params_.mu_merit * state.constraint_residual;

    // 6. Penalty adaptation.
    state.rho = next_rho(state.rho, state.primal_residual, state.dual_residual);

    state.iteration += 1;
    state.status = EngineStatus::kIterating;
    return state;
}

// ── Iteration loop ──────────────────────────────────────────────────

template <typename Schedule>
AdmmResult AdmmEngine::run_loop(IterateState state) {
    const CpuTimer timer("ADMM solve");
    constexpr int kBlocks =
        std::is_same<Schedule, ThreeBlockSchedule>::value ? 3 : 2;

    spdlog::info("ADMM ({}-block): {} binaries, {} continuous, "
                 "{} eq / {} ineq / {} coupling rows",
                 kBlocks, problem_.n(), problem_.l(),
                 problem_.num_equalities(), problem_.num_inequalities(),
                 problem_.num_coupling());
    spdlog::info("ADMM config: rho={:.4g}, beta={:.4g}, c={:.4g}, "
                 "maxiter={}, tol={:.2e}, rho_policy={}, closed_form_z={}",
                 state.rho, params_.beta, params_.factor_c, params_.maxiter,
                 params_.tol, to_string(params_.rho_policy),
                 builder_.has_closed_form_consensus());

    ResidualTracker tracker;
    IterateState best;
    bool have_best = false;
    EngineStatus terminal = EngineStatus::kMaxIterReached;

    for (;;) {
        const ScalarCPU rho_used = state.rho;
        state = step_impl<Schedule>(std::move(state));

        IterationRecord rec;
        rec.iteration = state.iteration - 1;
        rec.primal_residual = state.primal_residual;
        rec.dual_residual = state.dual_residual;
        rec.rho = rho_used;
        rec.objective = state.objective;
        rec.constraint_residual = state.constraint_residual;
        rec.merit = state.merit;
        tracker.record(rec);

        if (params_.verbose) {
            spdlog::info("  iter {:3d}: r_pri={:.2e} r_dual={:.2e} "
                         "rho={:.4g} obj={:.6f} viol={:.2e}",
                         rec.iteration, rec.primal_residual,
                         rec.dual_residual, rho_used, rec.objective,
                         rec.constraint_residual);
        }

        // Best iterate: lowest primal residual, ties by merit.
        if (!have_best || state.primal_residual < best.primal_residual ||
            (state.primal_residual == best.primal_residual &&
             state.merit < best.merit)) {
            best = state;
            have_best = true;
        }

        const bool primal_ok = state.primal_residual < params_.tol;
        const bool dual_ok = !params_.check_dual_residual ||
                             state.dual_residual < params_.dual_tol;
        if (primal_ok && dual_ok) {
            terminal = EngineStatus::kConverged;
            spdlog::info("ADMM converged at iteration {} "
                         "(r_pri={:.2e}, r_dual={:.2e})",
                         rec.iteration, rec.primal_residual,
                         rec.dual_residual);
            break;
        }
        if (state.iteration >= params_.maxiter) {
            terminal = EngineStatus::kMaxIterReached;
            spdlog::warn("ADMM did not converge within {} iterations "
                         "(best r_pri={:.2e})",
                         params_.maxiter, best.primal_residual);
            break;
        }
        if (timer.elapsed_seconds() >= params_.max_time_seconds) {
            terminal = EngineStatus::kTimeLimitReached;
            spdlog::warn("ADMM time limit of {:.3f} s reached after {} "
                         "iterations (best r_pri={:.2e})",
                         params_.max_time_seconds, state.iteration,
                         best.primal_residual);
            break;
        }
    }

    const ScalarCPU final_rho = state.rho;
    IterateState selected = terminal == EngineStatus::kConverged
                                ? std::move(state)
                                : std::move(best);
    selected.status = terminal;
    AdmmResult result = ResultAssembler::assemble(
        problem_, selected, std::move(tracker), params_);
    result.state.final_rho = final_rho;

    spdlog::info("ADMM result: fval={:.6f} violation={:.2e} feasible={} "
                 "iters={} status={}",
                 result.fval, result.constraint_residual, result.feasible,
                 result.state.iterations, to_string(result.state.status));
    return result;
}

}  // namespace mbo
