#include "solvers/qp_admm_solver.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

#include <Eigen/Dense>
#include <spdlog/spdlog.h>

#include "utils/timer.h"

namespace mbo {

namespace {

double inf_norm(const VectorXd& v) {
    return v.size() == 0 ? 0.0 : v.lpNorm<Eigen::Infinity>();
}

void check_instance(const ConvexInstance& qp) {
    const Index n = qp.dimension();
    const Index m = qp.num_rows();
    auto fail = [](const std::string& what) {
        throw SolverError(SolverErrorKind::kSolverFailure,
                          "QpAdmmSolver: " + what);
    };
    if (qp.H.rows() != n || qp.H.cols() != n) {
        fail("H is " + std::to_string(qp.H.rows()) + "x" +
             std::to_string(qp.H.cols()) + ", expected " +
             std::to_string(n) + "x" + std::to_string(n));
    }
    if (qp.lower.size() != n || qp.upper.size() != n) {
        fail("variable bounds do not match dimension " + std::to_string(n));
    }
    if (qp.row_upper.size() != m || (m > 0 && (qp.A.rows() != m ||
                                               qp.A.cols() != n))) {
        fail("constraint rows do not match A (" + std::to_string(m) +
             " rows expected)");
    }
    if (!qp.H.allFinite() || !qp.f.allFinite() ||
        (m > 0 && !qp.A.allFinite())) {
        fail("non-finite problem data");
    }
}

/// Primal infeasibility certificate (OSQP Eq. 29): a dual direction dy with
/// Abar'dy ~ 0 and u'max(dy, 0) + l'min(dy, 0) < 0.
bool is_primal_infeasible(const MatrixXd& abar, const VectorXd& lo,
                          const VectorXd& hi, const VectorXd& dy,
                          double eps) {
    const double dy_norm = inf_norm(dy);
    if (dy_norm <= 1e-30) return false;

    double support = 0.0;
    for (Index i = 0; i < dy.size(); ++i) {
        if (dy(i) > 0.0) {
            if (std::isinf(hi(i))) return false;
            support += hi(i) * dy(i);
        } else if (dy(i) < 0.0) {
            if (std::isinf(lo(i))) return false;
            support += lo(i) * dy(i);
        }
    }
    return inf_norm(abar.transpose() * dy) <= eps * dy_norm &&
           support < -eps * dy_norm;
}

}  // namespace

QpAdmmSolver::QpAdmmSolver(QpAdmmSettings settings)
    : settings_(settings) {
    if (settings_.rho <= 0.0 || settings_.sigma <= 0.0) {
        throw std::invalid_argument(
            "QpAdmmSolver: rho and sigma must be > 0");
    }
    if (settings_.alpha <= 0.0 || settings_.alpha >= 2.0) {
        throw std::invalid_argument(
            "QpAdmmSolver: alpha must be in (0, 2), got " +
            std::to_string(settings_.alpha));
    }
    if (settings_.max_iter < 1 || settings_.check_interval < 1) {
        throw std::invalid_argument(
            "QpAdmmSolver: max_iter and check_interval must be >= 1");
    }
}

ConvexSolution QpAdmmSolver::solve(const ConvexInstance& qp) {
    info_ = QpAdmmInfo{};
    check_instance(qp);

    const Index n = qp.dimension();
    const Index m_rows = qp.num_rows();
    const Index m = m_rows + n;

    ConvexSolution solution;
    if (n == 0) {
        solution.w = VectorXd();
        solution.objective = qp.constant;
        info_.converged = true;
        return solution;
    }

    // Stack the general rows on top of the variable bounds.
    MatrixXd abar = MatrixXd::Zero(m, n);
    VectorXd lo(m), hi(m);
    if (m_rows > 0) {
        abar.topRows(m_rows) = qp.A;
        lo.head(m_rows) = qp.row_lower;
        hi.head(m_rows) = qp.row_upper;
    }
    abar.bottomRows(n).setIdentity();
    lo.tail(n) = qp.lower;
    hi.tail(n) = qp.upper;

    for (Index i = 0; i < m; ++i) {
        if (lo(i) > hi(i)) {
            throw SolverError(SolverErrorKind::kInfeasible,
                              "QpAdmmSolver: bound " + std::to_string(i) +
                                  " has lower > upper");
        }
    }

    const MatrixXd ata = abar.transpose() * abar;
    const MatrixXd identity = MatrixXd::Identity(n, n);
    const double sigma = settings_.sigma;
    const double alpha = settings_.alpha;
    double rho = settings_.rho;

    Eigen::LDLT<MatrixXd> ldlt(qp.H + sigma * identity + rho * ata);
    if (ldlt.info() != Eigen::Success) {
        throw SolverError(SolverErrorKind::kSolverFailure,
                          "QpAdmmSolver: KKT factorization failed");
    }

    VectorXd w = VectorXd::Zero(n);
    VectorXd z = VectorXd::Zero(m);
    VectorXd y = VectorXd::Zero(m);

    const CpuTimer timer;
    bool converged = false;
    int iter = 0;

    for (; iter < settings_.max_iter; ++iter) {
        // ── w-update: one solve with the cached factorization ───────
        VectorXd rhs = sigma * w - qp.f + abar.transpose() * (rho * z - y);
        VectorXd w_tilde = ldlt.solve(rhs);
        VectorXd z_relaxed = alpha * (abar * w_tilde) + (1.0 - alpha) * z;
        w = alpha * w_tilde + (1.0 - alpha) * w;

        // ── z-update: projection onto [lo, hi] ──────────────────────
        VectorXd z_new = (z_relaxed + y / rho).cwiseMax(lo).cwiseMin(hi);

        // ── y-update ────────────────────────────────────────────────
        VectorXd dy = rho * (z_relaxed - z_new);
        y += dy;
        z = z_new;

        if (iter % settings_.check_interval != 0 &&
            iter != settings_.max_iter - 1) {
            continue;
        }

        if (timer.elapsed_seconds() >= settings_.max_time_seconds) {
            throw SolverError(SolverErrorKind::kCancelled,
                              "QpAdmmSolver: time limit of " +
                                  std::to_string(settings_.max_time_seconds) +
                                  " s reached at iteration " +
                                  std::to_string(iter));
        }

        if (is_primal_infeasible(abar, lo, hi, dy, settings_.eps_prim_inf)) {
            info_.iterations = iter + 1;
            throw SolverError(SolverErrorKind::kInfeasible,
                              "QpAdmmSolver: primal infeasibility "
                              "certificate at iteration " +
                                  std::to_string(iter));
        }

        // ── Termination (OSQP Section 3.4) ──────────────────────────
        VectorXd aw = abar * w;
        VectorXd hw = qp.H * w;
        VectorXd aty = abar.transpose() * y;

        const double r_prim = inf_norm(aw - z);
        const double r_dual = inf_norm(hw + qp.f + aty);
        const double scale_prim = std::max(inf_norm(aw), inf_norm(z));
        const double scale_dual =
            std::max({inf_norm(hw), inf_norm(aty), inf_norm(qp.f)});
        const double eps_prim = settings_.eps_abs + settings_.eps_rel * scale_prim;
        const double eps_dual = settings_.eps_abs + settings_.eps_rel * scale_dual;

        info_.primal_residual = r_prim;
        info_.dual_residual = r_dual;

        if (r_prim <= eps_prim && r_dual <= eps_dual) {
            converged = true;
            break;
        }

        // ── Adaptive rho (OSQP Section 5.2) ─────────────────────────
        if (settings_.adaptive_rho) {
            const double norm_prim = r_prim / std::max(scale_prim, 1e-30);
            const double norm_dual = r_dual / std::max(scale_dual, 1e-30);
            double rho_new = rho * std::sqrt(norm_prim / std::max(norm_dual, 1e-30));
            rho_new = std::clamp(rho_new, settings_.rho_min, settings_.rho_max);
            if (rho_new > settings_.adaptive_rho_tolerance * rho ||
                rho_new < rho / settings_.adaptive_rho_tolerance) {
                rho = rho_new;
                ldlt.compute(qp.H + sigma * identity + rho * ata);
                if (ldlt.info() != Eigen::Success) {
                    throw SolverError(SolverErrorKind::kSolverFailure,
                                      "QpAdmmSolver: KKT refactorization "
                                      "failed");
                }
            }
        }
    }

    info_.iterations = std::min(iter + 1, settings_.max_iter);
    info_.converged = converged;
    info_.rho = rho;

    // ── Polish: solve the reduced KKT system on the guessed active set ──
    if (settings_.polish) {
        std::vector<Index> lower_active;
        std::vector<Index> upper_active;
        for (Index i = 0; i < m; ++i) {
            if (z(i) - lo(i) < -y(i)) {
                lower_active.push_back(i);
            } else if (hi(i) - z(i) < y(i)) {
                upper_active.push_back(i);
            }
        }
        std::vector<Index> active = lower_active;
        active.insert(active.end(), upper_active.begin(), upper_active.end());
        const Index n_lower = static_cast<Index>(lower_active.size());
        const Index na = static_cast<Index>(active.size());

        MatrixXd kkt = MatrixXd::Zero(n + na, n + na);
        VectorXd rhs(n + na);
        kkt.topLeftCorner(n, n) = qp.H;
        rhs.head(n) = -qp.f;
        for (Index k = 0; k < na; ++k) {
            kkt.block(n + k, 0, 1, n) = abar.row(active[k]);
            kkt.block(0, n + k, n, 1) = abar.row(active[k]).transpose();
            rhs(n + k) = (k < n_lower) ? lo(active[k]) : hi(active[k]);
        }

        MatrixXd kkt_reg = kkt;
        kkt_reg.diagonal().head(n).array() += settings_.polish_delta;
        kkt_reg.diagonal().tail(na).array() -= settings_.polish_delta;
        Eigen::PartialPivLU<MatrixXd> lu(kkt_reg);

        VectorXd sol = lu.solve(rhs);
        for (int r = 0; r < settings_.polish_refine_iter; ++r) {
            sol += lu.solve(rhs - kkt * sol);
        }

        if (sol.allFinite()) {
            VectorXd w_pol = sol.head(n);
            const double tol = settings_.polish_tolerance;
            bool signs_ok = true;
            for (Index k = 0; k < na; ++k) {
                const double mult = sol(n + k);
                if ((k < n_lower && mult > tol) ||
                    (k >= n_lower && mult < -tol)) {
                    signs_ok = false;
                    break;
                }
            }
            const double viol = qp.max_violation(w_pol);
            const double stationarity =
                inf_norm(kkt.topRows(n) * sol - rhs.head(n));
            const double scale = 1.0 + inf_norm(w_pol) + inf_norm(qp.f);
            if (signs_ok && viol <= tol * scale && stationarity <= tol * scale) {
                w = w_pol;
                info_.polished = true;
            } else {
                spdlog::debug("QpAdmmSolver: polish rejected (viol={:.2e}, "
                              "stationarity={:.2e}, signs_ok={})",
                              viol, stationarity, signs_ok);
            }
        }
    }

    if (!converged && !info_.polished) {
        throw SolverError(SolverErrorKind::kSolverFailure,
                          "QpAdmmSolver: no convergence in " +
                              std::to_string(settings_.max_iter) +
                              " iterations (r_prim=" +
                              std::to_string(info_.primal_residual) +
                              ", r_dual=" +
                              std::to_string(info_.dual_residual) + ")");
    }

    solution.w = w;
    solution.objective = qp.objective(w);
    return solution;
}

}  // namespace mbo
