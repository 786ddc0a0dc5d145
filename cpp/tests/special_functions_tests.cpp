#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "scvst/special_functions.hpp"

#include <cmath>

namespace {
constexpr double kEulerGamma = 0.57721566490153286061;
constexpr double kPi = 3.14159265358979323846;
}  // namespace

TEST_CASE("digamma matches closed forms at integers", "[special_functions]") {
    // psi(1) = -gamma, psi(n + 1) = psi(n) + 1 / n
    REQUIRE_THAT(scvst::digamma(1.0), Catch::Matchers::WithinAbs(-kEulerGamma, 1e-14));
    REQUIRE_THAT(scvst::digamma(2.0), Catch::Matchers::WithinAbs(1.0 - kEulerGamma, 1e-14));
    REQUIRE_THAT(scvst::digamma(6.0),
                 Catch::Matchers::WithinAbs(137.0 / 60.0 - kEulerGamma, 1e-13));
    // psi(1/2) = -gamma - 2 log 2
    REQUIRE_THAT(scvst::digamma(0.5),
                 Catch::Matchers::WithinAbs(-kEulerGamma - 2.0 * std::log(2.0), 1e-13));
}

TEST_CASE("trigamma matches closed forms", "[special_functions]") {
    // psi'(1) = pi^2 / 6, psi'(1/2) = pi^2 / 2
    REQUIRE_THAT(scvst::trigamma(1.0), Catch::Matchers::WithinRel(kPi * kPi / 6.0, 1e-13));
    REQUIRE_THAT(scvst::trigamma(0.5), Catch::Matchers::WithinRel(kPi * kPi / 2.0, 1e-13));
    REQUIRE_THAT(scvst::trigamma(3.0),
                 Catch::Matchers::WithinRel(kPi * kPi / 6.0 - 1.0 - 0.25, 1e-12));
}

TEST_CASE("Special functions return NaN outside their domain", "[special_functions]") {
    REQUIRE(std::isnan(scvst::digamma(0.0)));
    REQUIRE(std::isnan(scvst::digamma(-2.0)));
    REQUIRE(std::isnan(scvst::trigamma(-1.0)));
    REQUIRE(std::isnan(scvst::digamma(std::nan(""))));
    REQUIRE(std::isnan(scvst::trigamma(std::nan(""))));
}

TEST_CASE("Array overloads apply elementwise", "[special_functions]") {
    Eigen::ArrayXd x(3);
    x << 1.0, 2.5, 10.0;

    const Eigen::ArrayXd psi = scvst::digamma(x);
    const Eigen::ArrayXd psi1 = scvst::trigamma(x);

    REQUIRE(psi.size() == 3);
    REQUIRE(psi1.size() == 3);
    for (Eigen::Index i = 0; i < x.size(); ++i) {
        REQUIRE(psi[i] == scvst::digamma(x[i]));
        REQUIRE(psi1[i] == scvst::trigamma(x[i]));
    }
}
