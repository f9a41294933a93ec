#pragma once

/// @file iterate_state.h
/// @brief ADMM iterate, engine status and per-iteration diagnostics.

#include "core/types.h"

namespace mbo {

/// Engine state machine:
///   kInitialized -> kIterating -> {kConverged, kMaxIterReached,
///                                  kTimeLimitReached}
/// The loop stamps the terminal status on the selected iterate; the
/// AdmmResult built from it is the read-only final stage.
enum class EngineStatus {
    kInitialized,
    kIterating,
    kConverged,
    kMaxIterReached,
    kTimeLimitReached,
};

/// True for kConverged, kMaxIterReached and kTimeLimitReached.
inline bool is_terminal(EngineStatus status) {
    return status == EngineStatus::kConverged ||
           status == EngineStatus::kMaxIterReached ||
           status == EngineStatus::kTimeLimitReached;
}

/// Upper-case name as used in reports ("CONVERGED", ...).
const char* to_string(EngineStatus status);

/// Complete ADMM iterate. Owned by one solve() call.
struct IterateState {
    VectorXd x;   ///< Binary block, entries 0.0 / 1.0 (n).
    VectorXd z;   ///< Relaxed copy of x in [0,1]^n.
    VectorXd u;   ///< Continuous block (l).
    VectorXd s;   ///< Consensus slack; zero in 2-block mode.
    VectorXd y;   ///< Unscaled multipliers of x - z - s = 0.
    ScalarCPU rho = 0.0;
    int iteration = 0;
    EngineStatus status = EngineStatus::kInitialized;

    // Residuals of the last completed pass.
    ScalarCPU primal_residual = kInf;     ///< ||x - z - s||_2
    ScalarCPU dual_residual = kInf;       ///< rho ||z - z_prev||_2
    ScalarCPU constraint_residual = kInf; ///< ProblemModel::constraint_violation
    ScalarCPU objective = kInf;           ///< Unpenalized objective.
    ScalarCPU merit = kInf;               ///< objective + mu_merit * constraint_residual
};

/// One entry of the residual history.
struct IterationRecord {
    int iteration = 0;
    ScalarCPU primal_residual = 0.0;
    ScalarCPU dual_residual = 0.0;
    ScalarCPU rho = 0.0;              ///< Penalty used during the pass.
    ScalarCPU objective = 0.0;
    ScalarCPU constraint_residual = 0.0;
    ScalarCPU merit = 0.0;
};

}  // namespace mbo
