#pragma once

/// @file report_writer.h
/// @brief CSV and JSON output of ADMM results for external plotting.

#include <string>

#include <nlohmann/json_fwd.hpp>

#include "models/problem_model.h"
#include "optimizer/result_assembler.h"

namespace mbo {

/// Result as JSON: status, convergence flags, fval, the named solution
/// ({name: value}, names from the problem or x0.., u0..), the solution
/// array and the per-iteration history.
nlohmann::json result_to_json(const AdmmResult& result,
                              const ProblemModel& problem);

/// Write result_to_json() to a file (2-space indent).
///
/// @throws std::runtime_error if the file cannot be opened.
void write_result_json(const AdmmResult& result,
                       const ProblemModel& problem,
                       const std::string& path);

/// Write the residual history to CSV, one row per iteration.
///
/// Columns: iteration, primal_residual, dual_residual, rho, objective,
/// constraint_residual, merit
///
/// @throws std::runtime_error if the file cannot be opened.
void write_residuals_csv(const AdmmResult& result, const std::string& path);

}  // namespace mbo
