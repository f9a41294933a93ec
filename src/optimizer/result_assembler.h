#pragma once

/// @file result_assembler.h
/// @brief Final ADMM result and its assembly from the selected iterate.

#include <vector>

#include "core/types.h"
#include "models/problem_model.h"
#include "optimizer/admm_params.h"
#include "optimizer/iterate_state.h"
#include "optimizer/residual_tracker.h"

namespace mbo {

/// Solve-level diagnostics.
struct AdmmState {
    ResidualTracker history;   ///< Frozen per-iteration records.
    bool converged = false;
    /// Terminal reason: kConverged, kMaxIterReached or kTimeLimitReached.
    EngineStatus status = EngineStatus::kInitialized;
    int iterations = 0;        ///< Completed passes.
    ScalarCPU final_rho = 0.0;
};

/// Result of AdmmEngine::solve().
struct AdmmResult {
    VectorXd x;                ///< Binary assignment (n).
    VectorXd u;                ///< Continuous values (l, empty if l = 0).
    VectorXd solution;         ///< [x; u].
    ScalarCPU fval = 0.0;      ///< q(x) + phi(u) + constant, unpenalized.
    ScalarCPU constraint_residual = 0.0;
    bool feasible = false;     ///< constraint_residual <= feasibility_tol.
    AdmmState state;

    /// Primal residual sequence of the run.
    std::vector<ScalarCPU> residuals() const {
        return state.history.primal_residuals();
    }
};

struct ResultAssembler {
    /// Package the selected iterate. The history is frozen and moved into
    /// the result; the status is taken from the snapshot.
    ///
    /// @throws std::invalid_argument if snapshot.status is not terminal.
    static AdmmResult assemble(const ProblemModel& problem,
                               const IterateState& snapshot,
                               ResidualTracker history,
                               const AdmmParams& params);
};

}  // namespace mbo
