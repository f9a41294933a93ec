#include "solvers/convex_solver.h"

#include <algorithm>

namespace mbo {

ScalarCPU ConvexInstance::max_violation(const VectorXd& w) const {
    double worst = 0.0;
    if (num_rows() > 0) {
        VectorXd aw = A * w;
        worst = std::max(worst, (row_lower - aw).maxCoeff());
        worst = std::max(worst, (aw - row_upper).maxCoeff());
    }
    if (dimension() > 0) {
        worst = std::max(worst, (lower - w).maxCoeff());
        worst = std::max(worst, (w - upper).maxCoeff());
    }
    return worst;
}

}  // namespace mbo
