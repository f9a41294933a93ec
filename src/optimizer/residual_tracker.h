#pragma once

/// @file residual_tracker.h
/// @brief Append-only per-iteration residual history.

#include <cstddef>
#include <vector>

#include "core/types.h"
#include "optimizer/iterate_state.h"

namespace mbo {

/// Records one IterationRecord per ADMM pass. Frozen (read-only) once the
/// solve that owns it completes.
class ResidualTracker {
public:
    /// @throws std::logic_error if the tracker is frozen.
    void record(const IterationRecord& rec);

    const std::vector<IterationRecord>& history() const { return records_; }

    /// Primal residual per iteration, in order.
    std::vector<ScalarCPU> primal_residuals() const;

    std::vector<ScalarCPU> dual_residuals() const;

    /// Smallest primal residual recorded so far (+inf when empty).
    ScalarCPU best_primal_residual() const;

    std::size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

    void freeze() { frozen_ = true; }
    bool frozen() const { return frozen_; }

private:
    std::vector<IterationRecord> records_;
    bool frozen_ = false;
};

}  // namespace mbo
