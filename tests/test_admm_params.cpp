#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "optimizer/admm_params.h"

using namespace mbo;
namespace fs = std::filesystem;

// ── Defaults and validation ─────────────────────────────────────────

TEST(AdmmParams, DefaultsAreValid) {
    AdmmParams p;
    EXPECT_NO_THROW(p.validate());
    EXPECT_DOUBLE_EQ(p.rho_initial, 10000.0);
    EXPECT_DOUBLE_EQ(p.beta, 1000.0);
    EXPECT_DOUBLE_EQ(p.factor_c, 100000.0);
    EXPECT_EQ(p.maxiter, 10);
    EXPECT_DOUBLE_EQ(p.tol, 1e-4);
    EXPECT_TRUE(p.three_block);
    EXPECT_EQ(p.rho_policy, RhoPolicy::kGrowTenPercent);
}

TEST(AdmmParams, RejectsNonPositiveRho) {
    AdmmParams p;
    p.rho_initial = 0.0;
    EXPECT_THROW(p.validate(), std::invalid_argument);
}

TEST(AdmmParams, RejectsRhoOutsideBounds) {
    AdmmParams p;
    p.rho_max = 100.0;  // rho_initial = 10000
    try {
        p.validate();
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("rho_initial"), std::string::npos);
    }
}

TEST(AdmmParams, RejectsInvalidFields) {
    {
        AdmmParams p;
        p.maxiter = 0;
        EXPECT_THROW(p.validate(), std::invalid_argument);
    }
    {
        AdmmParams p;
        p.tol = -1e-3;
        EXPECT_THROW(p.validate(), std::invalid_argument);
    }
    {
        AdmmParams p;
        p.beta = -1.0;
        EXPECT_THROW(p.validate(), std::invalid_argument);
    }
    {
        AdmmParams p;
        p.rho_growth = 1.0;
        EXPECT_THROW(p.validate(), std::invalid_argument);
    }
}

// ── JSON ────────────────────────────────────────────────────────────

TEST(AdmmParams, ParseOverridesDefaults) {
    nlohmann::json j = {
        {"admm", {
            {"rho_initial", 1001.0},
            {"beta", 500.0},
            {"maxiter", 50},
            {"three_block", false},
            {"rho_policy", "residual_balancing"},
            {"verbose", true},
        }},
    };
    AdmmParams p = parse_admm_params(j);
    EXPECT_DOUBLE_EQ(p.rho_initial, 1001.0);
    EXPECT_DOUBLE_EQ(p.beta, 500.0);
    EXPECT_EQ(p.maxiter, 50);
    EXPECT_FALSE(p.three_block);
    EXPECT_EQ(p.rho_policy, RhoPolicy::kResidualBalancing);
    EXPECT_TRUE(p.verbose);
    // Untouched fields keep their defaults.
    EXPECT_DOUBLE_EQ(p.factor_c, 100000.0);
}

TEST(AdmmParams, ParseBareObject) {
    nlohmann::json j = {{"tol", 1e-6}};
    EXPECT_DOUBLE_EQ(parse_admm_params(j).tol, 1e-6);
}

TEST(AdmmParams, ParseRejectsUnknownPolicy) {
    nlohmann::json j = {{"admm", {{"rho_policy", "adaptive"}}}};
    EXPECT_THROW(parse_admm_params(j), std::runtime_error);
}

TEST(AdmmParams, ParseRejectsWrongType) {
    nlohmann::json j = {{"admm", {{"maxiter", "ten"}}}};
    EXPECT_THROW(parse_admm_params(j), std::runtime_error);
}

TEST(AdmmParams, ParseRejectsInvalidValue) {
    nlohmann::json j = {{"admm", {{"tol", 0.0}}}};
    EXPECT_THROW(parse_admm_params(j), std::runtime_error);
}

TEST(AdmmParams, LoadFromFile) {
    fs::path path = fs::temp_directory_path() / "mbo_test_admm_params.json";
    {
        std::ofstream ofs(path);
        ofs << R"({"admm": {"factor_c": 900, "tol": 1e-6, "rho_policy": "fixed"}})";
    }
    AdmmParams p = load_admm_params(path.string());
    EXPECT_DOUBLE_EQ(p.factor_c, 900.0);
    EXPECT_DOUBLE_EQ(p.tol, 1e-6);
    EXPECT_EQ(p.rho_policy, RhoPolicy::kFixed);
    fs::remove(path);
}

TEST(AdmmParams, LoadMissingFileThrows) {
    EXPECT_THROW(load_admm_params("/nonexistent/admm_params.json"),
                 std::runtime_error);
}

TEST(AdmmParams, RhoPolicyNamesRoundTrip) {
    for (RhoPolicy policy : {RhoPolicy::kFixed, RhoPolicy::kGrowTenPercent,
                             RhoPolicy::kResidualBalancing}) {
        EXPECT_EQ(parse_rho_policy(to_string(policy)), policy);
    }
}
