#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "optimizer/result_assembler.h"
#include "reporting/report_writer.h"
#include "example_problems.h"

using namespace mbo;
namespace fs = std::filesystem;
using testing_problems::worked_example;

namespace {

AdmmResult sample_result(const ProblemModel& problem) {
    IterateState st;
    st.x = VectorXd(3);
    st.x << 1.0, 0.0, 0.0;
    st.u = VectorXd::Constant(1, 2.0);
    st.rho = 1101.1;
    st.status = EngineStatus::kConverged;

    ResidualTracker tracker;
    for (int k = 0; k < 3; ++k) {
        IterationRecord rec;
        rec.iteration = k;
        rec.primal_residual = 0.1 / (k + 1);
        rec.dual_residual = 2.0;
        rec.rho = 1001.0;
        rec.objective = 1.0;
        tracker.record(rec);
    }
    return ResultAssembler::assemble(problem, st, std::move(tracker),
                                     AdmmParams{});
}

}  // namespace

TEST(ReportWriter, ResultJsonContents) {
    ProblemModel problem = worked_example();
    nlohmann::json j = result_to_json(sample_result(problem), problem);

    EXPECT_EQ(j["status"].get<std::string>(), "CONVERGED");
    EXPECT_TRUE(j["converged"].get<bool>());
    EXPECT_EQ(j["iterations"].get<int>(), 3);
    EXPECT_DOUBLE_EQ(j["fval"].get<double>(), 1.0);
    EXPECT_DOUBLE_EQ(j["variables"]["v"].get<double>(), 1.0);
    EXPECT_DOUBLE_EQ(j["variables"]["u"].get<double>(), 2.0);
    EXPECT_EQ(j["solution"].size(), 4u);
    ASSERT_EQ(j["history"].size(), 3u);
    EXPECT_DOUBLE_EQ(j["history"][2]["primal_residual"].get<double>(),
                     0.1 / 3);
}

TEST(ReportWriter, UnnamedVariablesGetIndexLabels) {
    ProblemModel problem = worked_example();
    problem.binary_names.clear();
    problem.continuous_names.clear();
    nlohmann::json j = result_to_json(sample_result(problem), problem);

    EXPECT_TRUE(j["variables"].contains("x0"));
    EXPECT_TRUE(j["variables"].contains("x2"));
    EXPECT_TRUE(j["variables"].contains("u0"));
}

TEST(ReportWriter, WritesJsonFile) {
    ProblemModel problem = worked_example();
    fs::path path = fs::temp_directory_path() / "mbo_test_result.json";
    write_result_json(sample_result(problem), problem, path.string());

    std::ifstream ifs(path);
    ASSERT_TRUE(ifs.is_open());
    nlohmann::json j = nlohmann::json::parse(ifs);
    EXPECT_EQ(j["status"].get<std::string>(), "CONVERGED");
    fs::remove(path);
}

TEST(ReportWriter, WritesResidualCsv) {
    ProblemModel problem = worked_example();
    fs::path path = fs::temp_directory_path() / "mbo_test_residuals.csv";
    write_residuals_csv(sample_result(problem), path.string());

    std::ifstream ifs(path);
    ASSERT_TRUE(ifs.is_open());
    std::string line;
    std::getline(ifs, line);
    EXPECT_EQ(line,
              "iteration,primal_residual,dual_residual,rho,objective,"
              "constraint_residual,merit");

    int rows = 0;
    while (std::getline(ifs, line)) {
        if (!line.empty()) ++rows;
    }
    EXPECT_EQ(rows, 3);
    fs::remove(path);
}

TEST(ReportWriter, UnwritablePathThrows) {
    ProblemModel problem = worked_example();
    EXPECT_THROW(write_residuals_csv(sample_result(problem),
                                     "/nonexistent/dir/residuals.csv"),
                 std::runtime_error);
}
