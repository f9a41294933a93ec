#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

#include "optimizer/admm_engine.h"
#include "solvers/exhaustive_qubo_solver.h"
#include "solvers/qp_admm_solver.h"
#include "example_problems.h"

using namespace mbo;
using testing_problems::worked_example;
using testing_problems::worked_example_params;
using testing_problems::worked_example_two_block_params;

// ── Test fixture ────────────────────────────────────────────────────

/// Worked example with exact QUBO and polished QP solvers.
class ConvergenceTest : public ::testing::Test {
  protected:
    ProblemModel problem_ = worked_example();
    AdmmParams params_ = worked_example_params();
    ExhaustiveQuboSolver qubo_;
    QpAdmmSolver convex_;
};

// ── 3-block reaches the optimum ─────────────────────────────────────

/// With rho = 1001, beta = 1000, c = 900 the 3-block schedule settles on
/// x = [1, 0, 0], u = 2 well before the iteration limit.
TEST_F(ConvergenceTest, ThreeBlockFindsOptimum) {
    AdmmEngine engine(problem_, params_, qubo_, convex_);
    AdmmResult result = engine.solve();

    EXPECT_TRUE(result.state.converged)
        << "status " << to_string(result.state.status) << " after "
        << result.state.iterations << " iterations";
    EXPECT_LT(result.state.iterations, params_.maxiter);

    ASSERT_EQ(result.x.size(), 3);
    EXPECT_DOUBLE_EQ(result.x(0), 1.0);
    EXPECT_DOUBLE_EQ(result.x(1), 0.0);
    EXPECT_DOUBLE_EQ(result.x(2), 0.0);
    ASSERT_EQ(result.u.size(), 1);
    EXPECT_NEAR(result.u(0), 2.0, 1e-3);
    EXPECT_NEAR(result.fval, 1.0, 1e-3);
    EXPECT_TRUE(result.feasible);
    EXPECT_LT(result.constraint_residual, params_.feasibility_tol);

    ASSERT_EQ(result.solution.size(), 4);
    EXPECT_DOUBLE_EQ(result.solution(0), 1.0);
    EXPECT_NEAR(result.solution(3), 2.0, 1e-3);
}

/// The running minimum of the primal residual never increases and ends
/// below tol.
TEST_F(ConvergenceTest, PrimalResidualRunningMinimumDecreases) {
    AdmmEngine engine(problem_, params_, qubo_, convex_);
    AdmmResult result = engine.solve();

    std::vector<double> residuals = result.residuals();
    ASSERT_FALSE(residuals.empty());
    ASSERT_EQ(residuals.size(), result.state.history.size());

    double running_min = residuals.front();
    double prev_min = running_min;
    for (double r : residuals) {
        running_min = std::min(running_min, r);
        EXPECT_LE(running_min, prev_min);
        prev_min = running_min;
    }
    EXPECT_LT(running_min, params_.tol);
    EXPECT_LT(residuals.back(), params_.tol);
}

// ── 2-block ─────────────────────────────────────────────────────────

/// From rho = 10, c = 10 the 2-block schedule visits x = [0, 0, 0] and
/// x = [1, 0, 1] before settling on the optimum.
TEST_F(ConvergenceTest, TwoBlockFindsOptimum) {
    params_ = worked_example_two_block_params();
    AdmmEngine engine(problem_, params_, qubo_, convex_);
    AdmmResult result = engine.solve();

    EXPECT_TRUE(result.state.converged)
        << "status " << to_string(result.state.status) << " after "
        << result.state.iterations << " iterations";
    EXPECT_LT(result.state.iterations, params_.maxiter);
    EXPECT_GT(result.state.iterations, 1);

    ASSERT_EQ(result.x.size(), 3);
    EXPECT_DOUBLE_EQ(result.x(0), 1.0);
    EXPECT_DOUBLE_EQ(result.x(1), 0.0);
    EXPECT_DOUBLE_EQ(result.x(2), 0.0);
    ASSERT_EQ(result.u.size(), 1);
    EXPECT_NEAR(result.u(0), 2.0, 1e-3);
    EXPECT_NEAR(result.fval, 1.0, 1e-3);
    EXPECT_TRUE(result.feasible);
    EXPECT_LT(result.residuals().back(), params_.tol);
}

/// With the large penalty of the 3-block settings, 2-block only promises a
/// feasible point.
TEST_F(ConvergenceTest, TwoBlockReachesFeasiblePoint) {
    params_.three_block = false;
    AdmmEngine engine(problem_, params_, qubo_, convex_);
    AdmmResult result = engine.solve();

    EXPECT_TRUE(result.state.converged);
    EXPECT_LT(result.residuals().back(), params_.tol);
    EXPECT_TRUE(result.feasible);
    EXPECT_LT(result.constraint_residual, params_.feasibility_tol);
    // Feasible but not necessarily optimal.
    EXPECT_GE(result.fval, 1.0 - 1e-6);
}

// ── Determinism ─────────────────────────────────────────────────────

TEST_F(ConvergenceTest, DeterministicResults) {
    AdmmEngine engine(problem_, params_, qubo_, convex_);
    AdmmResult first = engine.solve();
    AdmmResult second = engine.solve();

    EXPECT_EQ(first.state.iterations, second.state.iterations);
    EXPECT_TRUE(first.x.isApprox(second.x));
    EXPECT_DOUBLE_EQ(first.fval, second.fval);
    EXPECT_EQ(first.residuals(), second.residuals());
}

/// The history records the penalty used in each pass.
TEST_F(ConvergenceTest, HistoryRecordsGrowingPenalty) {
    AdmmEngine engine(problem_, params_, qubo_, convex_);
    AdmmResult result = engine.solve();

    const auto& history = result.state.history.history();
    ASSERT_GE(history.size(), 2u);
    EXPECT_DOUBLE_EQ(history[0].rho, params_.rho_initial);
    for (std::size_t k = 1; k < history.size(); ++k) {
        EXPECT_EQ(history[k].iteration, static_cast<int>(k));
        EXPECT_NEAR(history[k].rho, history[k - 1].rho * params_.rho_growth,
                    1e-6 * history[k].rho);
    }
}
