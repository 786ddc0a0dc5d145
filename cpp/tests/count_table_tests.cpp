#include <catch2/catch_test_macros.hpp>

#include "scvst/count_table.hpp"

#include <Eigen/Core>

#include <limits>
#include <random>
#include <set>
#include <stdexcept>

TEST_CASE("build_count_table compresses repeated counts", "[count_table]") {
    Eigen::VectorXi y(7);
    y << 0, 0, 0, 1, 1, 2, 5;

    const auto table = scvst::build_count_table(y);

    REQUIRE(table.size() == 4);
    CHECK(table[0].value == 0);
    CHECK(table[0].multiplicity == 3);
    CHECK(table[1].value == 1);
    CHECK(table[1].multiplicity == 2);
    CHECK(table[2].value == 2);
    CHECK(table[2].multiplicity == 1);
    CHECK(table[3].value == 5);
    CHECK(table[3].multiplicity == 1);
    REQUIRE(scvst::total_multiplicity(table) == 7);
}

TEST_CASE("build_count_table covers every distinct value once", "[count_table]") {
    std::mt19937 rng(17);
    std::poisson_distribution<int> draw(3.0);

    Eigen::VectorXi y(500);
    std::set<int> distinct;
    for (Eigen::Index i = 0; i < y.size(); ++i) {
        y[i] = draw(rng);
        distinct.insert(y[i]);
    }

    const auto table = scvst::build_count_table(y);

    REQUIRE(table.size() == distinct.size());
    REQUIRE(scvst::total_multiplicity(table) == 500);
    for (std::size_t k = 0; k < table.size(); ++k) {
        REQUIRE(distinct.count(table[k].value) == 1);
        REQUIRE(table[k].multiplicity > 0);
        if (k > 0) {
            REQUIRE(table[k - 1].value < table[k].value);
        }
    }
}

TEST_CASE("build_count_table handles degenerate input", "[count_table]") {
    SECTION("Empty vector gives empty table") {
        const Eigen::VectorXi y(0);
        const auto table = scvst::build_count_table(y);
        REQUIRE(table.empty());
        REQUIRE(scvst::total_multiplicity(table) == 0);
    }

    SECTION("Single large value") {
        Eigen::VectorXi y(1);
        y << 1000;
        const auto table = scvst::build_count_table(y);
        REQUIRE(table.size() == 1);
        REQUIRE(table[0].value == 1000);
        REQUIRE(table[0].multiplicity == 1);
    }

    SECTION("Negative count is rejected") {
        Eigen::VectorXi y(3);
        y << 1, -1, 2;
        REQUIRE_THROWS_AS(scvst::build_count_table(y), std::invalid_argument);
    }
}

TEST_CASE("build_count_table handles counts far above the sample size", "[count_table]") {
    const int large = 1 << 30;
    Eigen::VectorXi y(5);
    y << large, 3, large, 0, 3;

    const auto table = scvst::build_count_table(y);

    REQUIRE(table.size() == 3);
    CHECK(table[0].value == 0);
    CHECK(table[0].multiplicity == 1);
    CHECK(table[1].value == 3);
    CHECK(table[1].multiplicity == 2);
    CHECK(table[2].value == large);
    CHECK(table[2].multiplicity == 2);
    CHECK(scvst::total_multiplicity(table) == 5);
}

TEST_CASE("coerce_counts truncates toward zero", "[count_table]") {
    Eigen::VectorXd values(4);
    values << 0.0, 1.9, 2.0, 7.5;

    const auto counts = scvst::coerce_counts(values);

    REQUIRE(counts.size() == 4);
    CHECK(counts[0] == 0);
    CHECK(counts[1] == 1);
    CHECK(counts[2] == 2);
    CHECK(counts[3] == 7);
}

TEST_CASE("coerce_counts rejects invalid values", "[count_table]") {
    Eigen::VectorXd negative(2);
    negative << 1.0, -0.5;
    REQUIRE_THROWS_AS(scvst::coerce_counts(negative), std::invalid_argument);

    Eigen::VectorXd not_finite(2);
    not_finite << 1.0, std::numeric_limits<double>::quiet_NaN();
    REQUIRE_THROWS_AS(scvst::coerce_counts(not_finite), std::invalid_argument);

    Eigen::VectorXd too_large(1);
    too_large << 1e12;
    REQUIRE_THROWS_AS(scvst::coerce_counts(too_large), std::invalid_argument);
}
