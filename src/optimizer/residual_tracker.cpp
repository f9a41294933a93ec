#include "optimizer/residual_tracker.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace mbo {

void ResidualTracker::record(const IterationRecord& rec) {
    if (frozen_) {
        throw std::logic_error(
            "ResidualTracker::record: history is frozen (iteration " +
            std::to_string(rec.iteration) + ")");
    }
    records_.push_back(rec);
}

std::vector<ScalarCPU> ResidualTracker::primal_residuals() const {
    std::vector<ScalarCPU> out;
    out.reserve(records_.size());
    for (const auto& r : records_) {
        out.push_back(r.primal_residual);
    }
    return out;
}

std::vector<ScalarCPU> ResidualTracker::dual_residuals() const {
    std::vector<ScalarCPU> out;
    out.reserve(records_.size());
    for (const auto& r : records_) {
        out.push_back(r.dual_residual);
    }
    return out;
}

ScalarCPU ResidualTracker::best_primal_residual() const {
    ScalarCPU best = kInf;
    for (const auto& r : records_) {
        best = std::min(best, r.primal_residual);
    }
    return best;
}

}  // namespace mbo
