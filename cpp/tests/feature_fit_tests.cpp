#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "scvst/feature_fit.hpp"

#include <Eigen/Dense>

#include <cmath>
#include <random>
#include <stdexcept>

using scvst::ThetaStatus;

TEST_CASE("fit_features fits each feature independently", "[feature_fit]") {
    std::mt19937 rng(2024);
    const Eigen::Index cells = 1500;

    // Feature 0: NB(mu = 4, theta = 1.5); feature 1: all zero; feature 2: NB(mu = 10, theta = 5)
    Eigen::MatrixXi counts = Eigen::MatrixXi::Zero(3, cells);
    std::gamma_distribution<double> rate_low(1.5, 4.0 / 1.5);
    std::gamma_distribution<double> rate_high(5.0, 10.0 / 5.0);
    for (Eigen::Index c = 0; c < cells; ++c) {
        std::poisson_distribution<int> low(rate_low(rng));
        std::poisson_distribution<int> high(rate_high(rng));
        counts(0, c) = low(rng);
        counts(2, c) = high(rng);
    }
    const Eigen::MatrixXd X = Eigen::MatrixXd::Ones(cells, 1);

    const auto fits = scvst::fit_features(counts, X);

    REQUIRE(fits.size() == 3);

    REQUIRE_FALSE(fits[0].skipped);
    REQUIRE(fits[0].mean_converged);
    REQUIRE(fits[0].status == ThetaStatus::Converged);
    REQUIRE_THAT(fits[0].coefficients[0], Catch::Matchers::WithinAbs(std::log(4.0), 0.1));
    REQUIRE_THAT(fits[0].theta, Catch::Matchers::WithinRel(1.5, 0.25));

    REQUIRE(fits[1].skipped);
    REQUIRE(fits[1].status == ThetaStatus::Unbounded);
    REQUIRE(std::isinf(fits[1].theta));
    REQUIRE(fits[1].coefficients.size() == 0);

    REQUIRE_FALSE(fits[2].skipped);
    REQUIRE(fits[2].status == ThetaStatus::Converged);
    REQUIRE_THAT(fits[2].coefficients[0], Catch::Matchers::WithinAbs(std::log(10.0), 0.1));
    REQUIRE_THAT(fits[2].theta, Catch::Matchers::WithinRel(5.0, 0.25));

    // Same answer as fitting the feature on its own.
    const Eigen::VectorXi y0 = counts.row(0).transpose();
    const auto mean = scvst::estimate_mean(y0, X);
    const auto theta = scvst::fit_theta(y0, mean.mu);
    REQUIRE(fits[0].theta == theta.theta);
}

TEST_CASE("fit_features validates shapes and reports failing features", "[feature_fit]") {
    SECTION("Cell count mismatch") {
        const Eigen::MatrixXi counts = Eigen::MatrixXi::Ones(2, 5);
        const Eigen::MatrixXd X = Eigen::MatrixXd::Ones(4, 1);
        REQUIRE_THROWS_AS(scvst::fit_features(counts, X), std::invalid_argument);
    }

    SECTION("Rank-deficient design names the feature") {
        Eigen::MatrixXi counts(1, 4);
        counts << 1, 2, 0, 3;
        Eigen::MatrixXd X(4, 2);
        X << 1, 1,
             1, 1,
             1, 1,
             1, 1;
        REQUIRE_THROWS_AS(scvst::fit_features(counts, X), std::runtime_error);
    }

    SECTION("Negative counts are rejected, not skipped") {
        Eigen::MatrixXi counts(2, 4);
        counts << 1, 2, 0, 3,
                  -1, 1, 0, 0;
        REQUIRE_THROWS_AS(scvst::fit_features(counts, Eigen::MatrixXd::Ones(4, 1)), std::invalid_argument);
    }
}

TEST_CASE("fit_features does not mistake large counts for an all-zero row", "[feature_fit]") {
    // Four copies of 2^30 wrap a 32-bit sum to exactly zero.
    const int large = 1 << 30;
    const Eigen::MatrixXi counts = Eigen::MatrixXi::Constant(1, 4, large);
    const Eigen::MatrixXd X = Eigen::MatrixXd::Ones(4, 1);

    const auto fits = scvst::fit_features(counts, X);

    REQUIRE(fits.size() == 1);
    REQUIRE_FALSE(fits[0].skipped);
    REQUIRE(fits[0].coefficients.size() == 1);
    REQUIRE_THAT(fits[0].coefficients[0], Catch::Matchers::WithinRel(std::log(static_cast<double>(large)), 1e-6));
}
