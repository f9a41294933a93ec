#include "optimizer/result_assembler.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace mbo {

AdmmResult ResultAssembler::assemble(const ProblemModel& problem,
                                     const IterateState& snapshot,
                                     ResidualTracker history,
                                     const AdmmParams& params) {
    if (!is_terminal(snapshot.status)) {
        throw std::invalid_argument(
            std::string("ResultAssembler: snapshot status ") +
            to_string(snapshot.status) + " is not terminal");
    }

    AdmmResult result;
    result.x = snapshot.x;
    result.u = snapshot.u;

    const Index n = problem.n();
    const Index l = problem.l();
    result.solution.resize(n + l);
    result.solution.head(n) = result.x;
    if (l > 0) {
        result.solution.tail(l) = result.u;
    }

    result.fval = problem.objective(result.x, result.u);
    result.constraint_residual =
        problem.constraint_violation(result.x, result.u);
    result.feasible = result.constraint_residual <= params.feasibility_tol;

    history.freeze();
    result.state.iterations = static_cast<int>(history.size());
    result.state.history = std::move(history);
    result.state.converged = snapshot.status == EngineStatus::kConverged;
    result.state.status = snapshot.status;
    result.state.final_rho = snapshot.rho;
    return result;
}

}  // namespace mbo
