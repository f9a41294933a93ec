#include "optimizer/subproblem_builder.h"

#include <stdexcept>

#include "core/errors.h"

namespace mbo {

SubproblemBuilder::SubproblemBuilder(const ProblemModel& problem,
                                     const AdmmParams& params)
    : problem_(problem), params_(params) {
    problem_.validate();
    params_.validate();

    const Index m_eq = problem_.num_equalities();
    const ScalarCPU c = params_.factor_c;

    // q(x) + (c/2)||Gx - b||^2 expanded; Q is symmetrized to absorb the
    // validation tolerance.
    qubo_quadratic_ = 0.5 * (problem_.Q + problem_.Q.transpose());
    qubo_linear_ = problem_.a;
    qubo_constant_ = problem_.constant;
    if (m_eq > 0) {
        qubo_quadratic_ += 0.5 * c * problem_.G.transpose() * problem_.G;
        qubo_linear_ -= c * problem_.G.transpose() * problem_.b;
        qubo_constant_ += 0.5 * c * problem_.b.squaredNorm();
    }

    bool coupling_touches_z = false;
    if (problem_.num_coupling() > 0 && problem_.coupling_x.size() > 0) {
        coupling_touches_z = (problem_.coupling_x.array() != 0.0).any();
    }
    closed_form_ = problem_.num_inequalities() == 0 && !coupling_touches_z;
}

QuboInstance SubproblemBuilder::build_qubo(const IterateState& state) const {
    const VectorXd target = state.z + state.s;
    const ScalarCPU rho = state.rho;

    QuboInstance qubo;
    qubo.quadratic = qubo_quadratic_;
    qubo.quadratic.diagonal().array() += 0.5 * rho;
    qubo.linear = qubo_linear_ + state.y - rho * target;
    qubo.constant = qubo_constant_ - state.y.dot(target) +
                    0.5 * rho * target.squaredNorm();
    return qubo;
}

ConvexInstance SubproblemBuilder::build_convex(const IterateState& state) const {
    const Index l = problem_.l();
    const Index nz = convex_z_size();
    const Index dim = nz + l;
    const Index m_g = closed_form_ ? 0 : problem_.num_inequalities();
    const Index m_c = problem_.num_coupling();
    const ScalarCPU rho = state.rho;

    ConvexInstance qp;
    qp.H = MatrixXd::Zero(dim, dim);
    qp.f = VectorXd::Zero(dim);
    qp.lower.resize(dim);
    qp.upper.resize(dim);
    qp.constant = 0.0;

    // ── z part: -y'z + (rho/2)||x - s - z||^2 on [0,1]^n ────────────
    if (nz > 0) {
        const VectorXd target = state.x - state.s;
        qp.H.topLeftCorner(nz, nz).diagonal().setConstant(rho);
        qp.f.head(nz) = -state.y - rho * target;
        qp.constant += state.y.dot(target) + 0.5 * rho * target.squaredNorm();
        qp.lower.head(nz).setZero();
        qp.upper.head(nz).setOnes();
    }

    // ── u part: phi(u) = 0.5 u'(2P)u + c'u on U ─────────────────────
    if (l > 0) {
        qp.H.bottomRightCorner(l, l) = problem_.P + problem_.P.transpose();
        qp.f.tail(l) = problem_.c;
        qp.lower.tail(l) = problem_.u_lower;
        qp.upper.tail(l) = problem_.u_upper;
    }

    // ── Rows: A_ineq z <= b_ineq, Cx z + Cu u <= d ──────────────────
    const Index m = m_g + m_c;
    qp.A = MatrixXd::Zero(m, dim);
    qp.row_lower = VectorXd::Constant(m, -kInf);
    qp.row_upper.resize(m);
    if (m_g > 0) {
        qp.A.block(0, 0, m_g, nz) = problem_.A_ineq;
        qp.row_upper.head(m_g) = problem_.b_ineq;
    }
    if (m_c > 0) {
        if (nz > 0 && problem_.coupling_x.size() > 0) {
            qp.A.block(m_g, 0, m_c, nz) = problem_.coupling_x;
        }
        if (l > 0 && problem_.coupling_u.size() > 0) {
            qp.A.block(m_g, nz, m_c, l) = problem_.coupling_u;
        }
        qp.row_upper.tail(m_c) = problem_.coupling_rhs;
    }
    return qp;
}

VectorXd SubproblemBuilder::closed_form_consensus(
    const IterateState& state) const {
    return (state.x - state.s + state.y / state.rho).cwiseMax(0.0).cwiseMin(1.0);
}

VectorXd SubproblemBuilder::update_slack(const IterateState& state) const {
    return (state.y + state.rho * (state.x - state.z)) /
           (params_.beta + state.rho);
}

}  // namespace mbo
