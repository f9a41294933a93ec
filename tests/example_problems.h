#pragma once

/// @file example_problems.h
/// @brief Small MBCO instances shared by the tests and benchmarks.

#include "core/types.h"
#include "models/problem_model.h"
#include "optimizer/admm_params.h"

namespace mbo {
namespace testing_problems {

/// Three binaries (v, w, t), one continuous u >= 0:
///
///   min  v + w + t + 5 (u - 2)^2
///   s.t. v + w = 1
///        v + w + t >= 1
///        v + 2w + t + u <= 3
///
/// Optimum x = [1, 0, 0], u = 2, objective 1.
inline ProblemModel worked_example() {
    ProblemModel p;
    p.Q = MatrixXd::Zero(3, 3);
    p.a = VectorXd::Ones(3);

    // 5 (u - 2)^2 = 5 u^2 - 20 u + 20
    p.P = MatrixXd::Constant(1, 1, 5.0);
    p.c = VectorXd::Constant(1, -20.0);
    p.constant = 20.0;

    p.G.resize(1, 3);
    p.G << 1.0, 1.0, 0.0;
    p.b = VectorXd::Ones(1);

    p.A_ineq.resize(1, 3);
    p.A_ineq << -1.0, -1.0, -1.0;
    p.b_ineq = VectorXd::Constant(1, -1.0);

    p.coupling_x.resize(1, 3);
    p.coupling_x << 1.0, 2.0, 1.0;
    p.coupling_u = MatrixXd::Ones(1, 1);
    p.coupling_rhs = VectorXd::Constant(1, 3.0);

    p.u_lower = VectorXd::Zero(1);
    p.u_upper = VectorXd::Constant(1, kInf);

    p.binary_names = {"v", "w", "t"};
    p.continuous_names = {"u"};
    return p;
}

/// Settings under which the 3-block schedule reaches the optimum of
/// worked_example().
inline AdmmParams worked_example_params() {
    AdmmParams params;
    params.rho_initial = 1001.0;
    params.beta = 1000.0;
    params.factor_c = 900.0;
    params.maxiter = 100;
    params.tol = 1e-6;
    params.three_block = true;
    return params;
}

/// 2-block settings that reach the optimum of worked_example(). With
/// rho = 1001 the 2-block schedule locks into x = [1, 0, 1]: flipping t off
/// costs about rho / 2 in the consensus term. From rho = 10 it passes
/// through that point and leaves it.
inline AdmmParams worked_example_two_block_params() {
    AdmmParams params = worked_example_params();
    params.rho_initial = 10.0;
    params.factor_c = 10.0;
    params.three_block = false;
    return params;
}

/// Binary-only problem with a single equality:
///
///   min x0 + 2 x1   s.t. x0 + x1 = 1
///
/// Optimum x = [1, 0]. No row touches z, so the consensus step is closed
/// form.
inline ProblemModel assignment_problem() {
    ProblemModel p;
    p.Q = MatrixXd::Zero(2, 2);
    p.a.resize(2);
    p.a << 1.0, 2.0;
    p.G = MatrixXd::Ones(1, 2);
    p.b = VectorXd::Ones(1);
    return p;
}

}  // namespace testing_problems
}  // namespace mbo
