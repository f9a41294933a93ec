#include <benchmark/benchmark.h>

#include <random>

#include <spdlog/spdlog.h>

#include "optimizer/admm_engine.h"
#include "solvers/exhaustive_qubo_solver.h"
#include "solvers/qp_admm_solver.h"
#include "example_problems.h"

using namespace mbo;

// ── Helpers ─────────────────────────────────────────────────────────

/// Random symmetric QUBO with entries in [-1, 1].
static QuboInstance make_random_qubo(Index n, unsigned seed) {
    std::mt19937 gen(seed);
    std::uniform_real_distribution<double> dist(-1.0, 1.0);
    MatrixXd m(n, n);
    for (Index i = 0; i < n; ++i)
        for (Index j = 0; j < n; ++j) m(i, j) = dist(gen);

    QuboInstance q;
    q.quadratic = 0.5 * (m + m.transpose());
    q.linear = VectorXd(n);
    for (Index i = 0; i < n; ++i) q.linear(i) = dist(gen);
    return q;
}

/// Random strictly convex QP: H = M'M + I, one budget row, box [0, 1].
static ConvexInstance make_random_qp(Index n, unsigned seed) {
    std::mt19937 gen(seed);
    std::normal_distribution<double> dist(0.0, 1.0);
    MatrixXd m(n, n);
    for (Index i = 0; i < n; ++i)
        for (Index j = 0; j < n; ++j) m(i, j) = dist(gen);

    ConvexInstance qp;
    qp.H = m.transpose() * m + MatrixXd::Identity(n, n);
    qp.f = VectorXd(n);
    for (Index i = 0; i < n; ++i) qp.f(i) = dist(gen);
    qp.A = MatrixXd::Ones(1, n);
    qp.row_lower = VectorXd::Constant(1, -kInf);
    qp.row_upper = VectorXd::Constant(1, 0.5 * n);
    qp.lower = VectorXd::Zero(n);
    qp.upper = VectorXd::Ones(n);
    return qp;
}

/// Pick k of n sites; each open site i allows 0 <= u_i <= 2 and pays
/// (u_i - target_i)^2:
///   min  sum cost_i x_i + sum (u_i - target_i)^2
///   s.t. sum x = k,  u_i - 2 x_i <= 0,  u in [0, 2]
static ProblemModel make_site_selection(Index n, Index k, unsigned seed) {
    std::mt19937 gen(seed);
    std::uniform_real_distribution<double> dist(0.0, 1.0);

    ProblemModel p;
    p.Q = MatrixXd::Zero(n, n);
    p.a = VectorXd(n);
    VectorXd target(n);
    for (Index i = 0; i < n; ++i) {
        p.a(i) = dist(gen);
        target(i) = 2.0 * dist(gen);
    }
    p.P = MatrixXd::Identity(n, n);
    p.c = -2.0 * target;
    p.constant = target.squaredNorm();

    p.G = MatrixXd::Ones(1, n);
    p.b = VectorXd::Constant(1, static_cast<double>(k));

    p.coupling_x = -2.0 * MatrixXd::Identity(n, n);
    p.coupling_u = MatrixXd::Identity(n, n);
    p.coupling_rhs = VectorXd::Zero(n);

    p.u_lower = VectorXd::Zero(n);
    p.u_upper = VectorXd::Constant(n, 2.0);
    return p;
}

// ── Port benchmarks ─────────────────────────────────────────────────

static void BM_ExhaustiveQubo(benchmark::State& state) {
    const Index n = static_cast<Index>(state.range(0));
    QuboInstance q = make_random_qubo(n, 42);
    ExhaustiveQuboSolver solver;

    for (auto _ : state) {
        QuboSolution sol = solver.solve(q);
        benchmark::DoNotOptimize(sol.x.data());
        benchmark::ClobberMemory();
    }
    state.counters["assignments"] = benchmark::Counter(
        static_cast<double>(1ULL << n), benchmark::Counter::kIsIterationInvariantRate);
}

BENCHMARK(BM_ExhaustiveQubo)
    ->Arg(8)
    ->Arg(12)
    ->Arg(16)
    ->Arg(20)
    ->Unit(benchmark::kMillisecond);

static void BM_QpAdmmSolve(benchmark::State& state) {
    const Index n = static_cast<Index>(state.range(0));
    ConvexInstance qp = make_random_qp(n, 7);
    QpAdmmSolver solver;

    for (auto _ : state) {
        ConvexSolution sol = solver.solve(qp);
        benchmark::DoNotOptimize(sol.w.data());
        benchmark::ClobberMemory();
        state.counters["iterations"] = benchmark::Counter(
            static_cast<double>(solver.last_info().iterations),
            benchmark::Counter::kDefaults);
        state.counters["polished"] = benchmark::Counter(
            solver.last_info().polished ? 1.0 : 0.0,
            benchmark::Counter::kDefaults);
    }
}

BENCHMARK(BM_QpAdmmSolve)
    ->Arg(4)
    ->Arg(16)
    ->Arg(64)
    ->Unit(benchmark::kMillisecond);

// ── Engine benchmarks ───────────────────────────────────────────────

/// Worked example, 3-block (arg 1) vs 2-block (arg 0).
static void BM_AdmmWorkedExample(benchmark::State& state) {
    spdlog::set_level(spdlog::level::warn);
    const AdmmParams params =
        state.range(0) != 0
            ? testing_problems::worked_example_params()
            : testing_problems::worked_example_two_block_params();

    ExhaustiveQuboSolver qubo;
    QpAdmmSolver convex;
    AdmmEngine engine(testing_problems::worked_example(), params, qubo, convex);

    for (auto _ : state) {
        AdmmResult result = engine.solve();
        benchmark::DoNotOptimize(result.solution.data());
        benchmark::ClobberMemory();
        state.counters["iterations"] = benchmark::Counter(
            static_cast<double>(result.state.iterations),
            benchmark::Counter::kDefaults);
        state.counters["converged"] = benchmark::Counter(
            result.state.converged ? 1.0 : 0.0,
            benchmark::Counter::kDefaults);
    }
}

BENCHMARK(BM_AdmmWorkedExample)
    ->Arg(0)
    ->Arg(1)
    ->Unit(benchmark::kMillisecond);

/// Site selection with n binaries and n continuous variables.
static void BM_AdmmSiteSelection(benchmark::State& state) {
    spdlog::set_level(spdlog::level::warn);
    const Index n = static_cast<Index>(state.range(0));
    ProblemModel problem = make_site_selection(n, n / 2, 11);

    AdmmParams params;
    params.rho_initial = 1001.0;
    params.beta = 1000.0;
    params.factor_c = 900.0;
    params.maxiter = 50;
    params.tol = 1e-6;

    ExhaustiveQuboSolver qubo;
    QpAdmmSolver convex;
    AdmmEngine engine(problem, params, qubo, convex);

    for (auto _ : state) {
        AdmmResult result = engine.solve();
        benchmark::DoNotOptimize(result.solution.data());
        benchmark::ClobberMemory();
        state.counters["iterations"] = benchmark::Counter(
            static_cast<double>(result.state.iterations),
            benchmark::Counter::kDefaults);
        state.counters["feasible"] = benchmark::Counter(
            result.feasible ? 1.0 : 0.0, benchmark::Counter::kDefaults);
    }
}

BENCHMARK(BM_AdmmSiteSelection)
    ->Arg(4)
    ->Arg(8)
    ->Arg(12)
    ->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
