#include <gtest/gtest.h>

#include <stdexcept>

#include "optimizer/result_assembler.h"
#include "example_problems.h"

using namespace mbo;
using testing_problems::worked_example;

namespace {

IterateState snapshot_at(double v, double w, double t, double u,
                         EngineStatus status = EngineStatus::kConverged) {
    IterateState st;
    st.x = VectorXd(3);
    st.x << v, w, t;
    st.z = st.x;
    st.s = VectorXd::Zero(3);
    st.y = VectorXd::Zero(3);
    st.u = VectorXd::Constant(1, u);
    st.rho = 1331.0;
    st.status = status;
    return st;
}

ResidualTracker two_records() {
    ResidualTracker tracker;
    IterationRecord rec;
    rec.iteration = 0;
    rec.primal_residual = 0.3;
    tracker.record(rec);
    rec.iteration = 1;
    rec.primal_residual = 1e-8;
    tracker.record(rec);
    return tracker;
}

}  // namespace

TEST(ResultAssembler, PackagesOptimum) {
    ProblemModel problem = worked_example();
    AdmmParams params;

    AdmmResult result = ResultAssembler::assemble(
        problem, snapshot_at(1, 0, 0, 2.0), two_records(), params);

    ASSERT_EQ(result.solution.size(), 4);
    EXPECT_DOUBLE_EQ(result.solution(0), 1.0);
    EXPECT_DOUBLE_EQ(result.solution(3), 2.0);
    EXPECT_DOUBLE_EQ(result.fval, 1.0);
    EXPECT_DOUBLE_EQ(result.constraint_residual, 0.0);
    EXPECT_TRUE(result.feasible);

    EXPECT_TRUE(result.state.converged);
    EXPECT_EQ(result.state.status, EngineStatus::kConverged);
    EXPECT_EQ(result.state.iterations, 2);
    EXPECT_DOUBLE_EQ(result.state.final_rho, 1331.0);
    EXPECT_TRUE(result.state.history.frozen());

    auto residuals = result.residuals();
    ASSERT_EQ(residuals.size(), 2u);
    EXPECT_DOUBLE_EQ(residuals[1], 1e-8);
}

TEST(ResultAssembler, FlagsInfeasibleIterate) {
    ProblemModel problem = worked_example();
    AdmmParams params;

    // v + w = 2 breaks the equality; coupling 1 + 2 + 0 + 2 = 5 > 3.
    AdmmResult result = ResultAssembler::assemble(
        problem,
        snapshot_at(1, 1, 0, 2.0, EngineStatus::kMaxIterReached),
        two_records(), params);

    EXPECT_FALSE(result.state.converged);
    EXPECT_EQ(result.state.status, EngineStatus::kMaxIterReached);
    EXPECT_DOUBLE_EQ(result.constraint_residual, 3.0);
    EXPECT_FALSE(result.feasible);
    EXPECT_DOUBLE_EQ(result.fval, 2.0);
}

TEST(ResultAssembler, HistoryIsReadOnlyAfterAssembly) {
    ProblemModel problem = worked_example();
    AdmmParams params;
    AdmmResult result = ResultAssembler::assemble(
        problem, snapshot_at(1, 0, 0, 2.0), two_records(), params);

    EXPECT_THROW(result.state.history.record(IterationRecord{}),
                 std::logic_error);
}

TEST(ResultAssembler, RejectsNonTerminalSnapshot) {
    ProblemModel problem = worked_example();
    AdmmParams params;
    for (EngineStatus status :
         {EngineStatus::kInitialized, EngineStatus::kIterating}) {
        EXPECT_THROW(ResultAssembler::assemble(
                         problem, snapshot_at(1, 0, 0, 2.0, status),
                         two_records(), params),
                     std::invalid_argument)
            << to_string(status);
    }
}

TEST(ResultAssembler, TimeLimitIsNotConverged) {
    ProblemModel problem = worked_example();
    AdmmParams params;
    AdmmResult result = ResultAssembler::assemble(
        problem,
        snapshot_at(1, 0, 0, 2.0, EngineStatus::kTimeLimitReached),
        two_records(), params);

    EXPECT_FALSE(result.state.converged);
    EXPECT_EQ(result.state.status, EngineStatus::kTimeLimitReached);
}
