#include "core/errors.h"

namespace mbo {

SubproblemFailure::SubproblemFailure(int iteration, SubproblemBlock block,
                                     SolverErrorKind kind,
                                     const std::string& detail)
    : std::runtime_error(std::string("SubproblemFailure: ") +
                         to_string(block) + " block failed at iteration " +
                         std::to_string(iteration) + " (" + to_string(kind) +
                         "): " + detail),
      iteration_(iteration),
      block_(block),
      kind_(kind) {}

const char* to_string(SolverErrorKind kind) {
    switch (kind) {
        case SolverErrorKind::kInfeasible:    return "infeasible";
        case SolverErrorKind::kSolverFailure: return "solver failure";
        case SolverErrorKind::kCancelled:     return "cancelled";
    }
    return "unknown";
}

const char* to_string(SubproblemBlock block) {
    switch (block) {
        case SubproblemBlock::kBinary:     return "binary";
        case SubproblemBlock::kContinuous: return "continuous";
    }
    return "unknown";
}

}  // namespace mbo
