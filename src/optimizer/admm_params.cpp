#include "optimizer/admm_params.h"

#include <cmath>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace mbo {

namespace {

void require(bool ok, const std::string& field, const std::string& rule,
             double value) {
    if (!ok) {
        throw std::invalid_argument(
            "AdmmParams: " + field + " must be " + rule + ", got " +
            std::to_string(value));
    }
}

}  // namespace

void AdmmParams::validate() const {
    require(rho_min > 0.0, "rho_min", "> 0", rho_min);
    require(rho_max >= rho_min, "rho_max", ">= rho_min", rho_max);
    require(rho_initial > 0.0, "rho_initial", "> 0", rho_initial);
    require(rho_initial >= rho_min && rho_initial <= rho_max, "rho_initial",
            "within [rho_min, rho_max]", rho_initial);
    require(beta >= 0.0 && std::isfinite(beta), "beta", ">= 0", beta);
    require(factor_c >= 0.0 && std::isfinite(factor_c), "factor_c", ">= 0",
            factor_c);
    require(maxiter > 0, "maxiter", "> 0", maxiter);
    require(tol > 0.0, "tol", "> 0", tol);
    require(rho_growth > 1.0, "rho_growth", "> 1", rho_growth);
    require(tau_incr > 1.0, "tau_incr", "> 1", tau_incr);
    require(tau_decr > 1.0, "tau_decr", "> 1", tau_decr);
    require(mu_res > 1.0, "mu_res", "> 1", mu_res);
    require(dual_tol > 0.0, "dual_tol", "> 0", dual_tol);
    require(mu_merit >= 0.0, "mu_merit", ">= 0", mu_merit);
    require(feasibility_tol > 0.0, "feasibility_tol", "> 0", feasibility_tol);
    require(max_time_seconds > 0.0, "max_time_seconds", "> 0",
            max_time_seconds);
}

const char* to_string(RhoPolicy policy) {
    switch (policy) {
        case RhoPolicy::kFixed: return "fixed";
        case RhoPolicy::kGrowTenPercent: return "grow";
        case RhoPolicy::kResidualBalancing: return "residual_balancing";
    }
    return "unknown";
}

RhoPolicy parse_rho_policy(const std::string& name) {
    if (name == "fixed") return RhoPolicy::kFixed;
    if (name == "grow") return RhoPolicy::kGrowTenPercent;
    if (name == "residual_balancing") return RhoPolicy::kResidualBalancing;
    throw std::runtime_error("parse_rho_policy: unknown policy '" + name +
                             "' (expected fixed, grow or residual_balancing)");
}

AdmmParams parse_admm_params(const nlohmann::json& j) {
    const nlohmann::json& a = j.contains("admm") ? j["admm"] : j;
    if (!a.is_object()) {
        throw std::runtime_error("parse_admm_params: \"admm\" is not an object");
    }

    AdmmParams p;
    try {
        if (a.contains("rho_initial"))
            p.rho_initial = a["rho_initial"].get<double>();
        if (a.contains("beta"))
            p.beta = a["beta"].get<double>();
        if (a.contains("factor_c"))
            p.factor_c = a["factor_c"].get<double>();
        if (a.contains("maxiter"))
            p.maxiter = a["maxiter"].get<int>();
        if (a.contains("tol"))
            p.tol = a["tol"].get<double>();
        if (a.contains("three_block"))
            p.three_block = a["three_block"].get<bool>();

        // Penalty adaptation.
        if (a.contains("rho_policy"))
            p.rho_policy = parse_rho_policy(a["rho_policy"].get<std::string>());
        if (a.contains("rho_growth"))
            p.rho_growth = a["rho_growth"].get<double>();
        if (a.contains("tau_incr"))
            p.tau_incr = a["tau_incr"].get<double>();
        if (a.contains("tau_decr"))
            p.tau_decr = a["tau_decr"].get<double>();
        if (a.contains("mu_res"))
            p.mu_res = a["mu_res"].get<double>();
        if (a.contains("rho_min"))
            p.rho_min = a["rho_min"].get<double>();
        if (a.contains("rho_max"))
            p.rho_max = a["rho_max"].get<double>();

        // Termination and selection.
        if (a.contains("check_dual_residual"))
            p.check_dual_residual = a["check_dual_residual"].get<bool>();
        if (a.contains("dual_tol"))
            p.dual_tol = a["dual_tol"].get<double>();
        if (a.contains("mu_merit"))
            p.mu_merit = a["mu_merit"].get<double>();
        if (a.contains("feasibility_tol"))
            p.feasibility_tol = a["feasibility_tol"].get<double>();
        if (a.contains("max_time_seconds"))
            p.max_time_seconds = a["max_time_seconds"].get<double>();

        if (a.contains("verbose"))
            p.verbose = a["verbose"].get<bool>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("parse_admm_params: ") + e.what());
    }

    try {
        p.validate();
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("parse_admm_params: ") + e.what());
    }
    return p;
}

AdmmParams load_admm_params(const std::string& json_path) {
    std::ifstream ifs(json_path);
    if (!ifs.is_open()) {
        throw std::runtime_error("load_admm_params: cannot open " + json_path);
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(ifs);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("load_admm_params: " + json_path + ": " +
                                 e.what());
    }
    return parse_admm_params(j);
}

}  // namespace mbo
