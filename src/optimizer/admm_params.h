#pragma once

/// @file admm_params.h
/// @brief Configuration of the mixed-binary ADMM engine.
///
/// Defaults follow Gambella & Simonetto (2020), Section V: a large
/// initial penalty rho, a large slack weight beta and an even larger
/// equality penalty factor c, grown by 10% per iteration.

#include <string>

#include <nlohmann/json_fwd.hpp>

#include "core/types.h"

namespace mbo {

/// Penalty parameter update rule, applied after every iteration.
enum class RhoPolicy {
    kFixed,               ///< rho never changes.
    kGrowTenPercent,      ///< rho *= rho_growth (1.1 by default).
    kResidualBalancing,   ///< Boyd et al. (2011), Eq. (3.13).
};

/// Engine configuration. Immutable during a solve.
struct AdmmParams {
    ScalarCPU rho_initial = 10000.0;  ///< Initial penalty of x = z + s.
    ScalarCPU beta = 1000.0;          ///< Weight of the consensus slack block.
    ScalarCPU factor_c = 100000.0;    ///< Penalty of G x = b in the QUBO.
    int maxiter = 10;                 ///< Iteration limit.
    ScalarCPU tol = 1e-4;             ///< Primal residual tolerance.
    bool three_block = true;          ///< false drops the slack block.

    RhoPolicy rho_policy = RhoPolicy::kGrowTenPercent;
    ScalarCPU rho_growth = 1.1;       ///< Factor of kGrowTenPercent.
    ScalarCPU tau_incr = 2.0;         ///< Residual balancing increase.
    ScalarCPU tau_decr = 2.0;         ///< Residual balancing decrease.
    ScalarCPU mu_res = 10.0;          ///< Residual ratio threshold.
    ScalarCPU rho_min = 1e-6;
    ScalarCPU rho_max = 1e10;

    bool check_dual_residual = false; ///< Also require dual < dual_tol.
    ScalarCPU dual_tol = 1e-4;

    ScalarCPU mu_merit = 1000.0;      ///< Constraint weight of the merit value.
    ScalarCPU feasibility_tol = 1e-6; ///< Threshold of AdmmResult::feasible.
    ScalarCPU max_time_seconds = kInf;

    bool verbose = false;             ///< Per-iteration info logging.

    /// @throws std::invalid_argument naming the offending field.
    void validate() const;
};

const char* to_string(RhoPolicy policy);

/// Parse "fixed", "grow" or "residual_balancing".
///
/// @throws std::runtime_error on an unknown name.
RhoPolicy parse_rho_policy(const std::string& name);

/// Build AdmmParams from the "admm" object of a JSON document (or from the
/// object itself if it has no "admm" key). Missing fields keep their
/// defaults; the result is validated.
///
/// @throws std::runtime_error on wrongly typed fields or failed validation.
AdmmParams parse_admm_params(const nlohmann::json& j);

/// Load AdmmParams from a JSON file.
///
/// @param json_path Path to the JSON configuration file.
/// @throws std::runtime_error if the file cannot be read or is invalid.
AdmmParams load_admm_params(const std::string& json_path);

}  // namespace mbo
