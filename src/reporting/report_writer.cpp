#include "reporting/report_writer.h"

#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <vector>

#include <nlohmann/json.hpp>

#include "optimizer/iterate_state.h"

namespace mbo {

namespace {

std::string label(const std::vector<std::string>& names, Index i,
                  const char* prefix) {
    if (static_cast<std::size_t>(i) < names.size() && !names[i].empty()) {
        return names[i];
    }
    return prefix + std::to_string(i);
}

std::vector<double> to_vector(const VectorXd& v) {
    return std::vector<double>(v.data(), v.data() + v.size());
}

}  // namespace

nlohmann::json result_to_json(const AdmmResult& result,
                              const ProblemModel& problem) {
    nlohmann::json j;
    j["status"] = to_string(result.state.status);
    j["converged"] = result.state.converged;
    j["iterations"] = result.state.iterations;
    j["final_rho"] = result.state.final_rho;
    j["fval"] = result.fval;
    j["constraint_residual"] = result.constraint_residual;
    j["feasible"] = result.feasible;

    // Solution as object {name: value}.
    nlohmann::json vars = nlohmann::json::object();
    for (Index i = 0; i < result.x.size(); ++i) {
        vars[label(problem.binary_names, i, "x")] = result.x(i);
    }
    for (Index i = 0; i < result.u.size(); ++i) {
        vars[label(problem.continuous_names, i, "u")] = result.u(i);
    }
    j["variables"] = vars;
    j["solution"] = to_vector(result.solution);

    nlohmann::json history = nlohmann::json::array();
    for (const auto& rec : result.state.history.history()) {
        history.push_back({
            {"iteration", rec.iteration},
            {"primal_residual", rec.primal_residual},
            {"dual_residual", rec.dual_residual},
            {"rho", rec.rho},
            {"objective", rec.objective},
            {"constraint_residual", rec.constraint_residual},
            {"merit", rec.merit},
        });
    }
    j["history"] = history;
    return j;
}

void write_result_json(const AdmmResult& result,
                       const ProblemModel& problem,
                       const std::string& path) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("write_result_json: cannot open " + path);
    }
    ofs << result_to_json(result, problem).dump(2) << "\n";
}

void write_residuals_csv(const AdmmResult& result, const std::string& path) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("write_residuals_csv: cannot open " + path);
    }

    ofs << std::scientific << std::setprecision(9);
    ofs << "iteration,primal_residual,dual_residual,rho,objective,"
           "constraint_residual,merit\n";

    for (const auto& rec : result.state.history.history()) {
        ofs << rec.iteration << ","
            << rec.primal_residual << ","
            << rec.dual_residual << ","
            << rec.rho << ","
            << rec.objective << ","
            << rec.constraint_residual << ","
            << rec.merit << "\n";
    }
}

}  // namespace mbo
