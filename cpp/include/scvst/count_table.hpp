#pragma once

#include <Eigen/Core>

#include <cstddef>
#include <vector>

namespace scvst {

struct CountBin {
    int value{0};
    std::size_t multiplicity{0};
};

// Distinct counts with their multiplicities, ascending by value.
using CountTable = std::vector<CountBin>;

/**
 * Compresses a count vector into (distinct value, multiplicity) pairs.
 *
 * Bin-counts every integer in 0..max(y) and keeps the non-empty bins, so the
 * cost is O(N + max(y)) time and O(max(y)) memory. This pays off for typical
 * single-cell counts (many zeros and ties) and degrades for sparse counts of
 * large magnitude.
 *
 * An empty vector yields an empty table. Throws std::invalid_argument on a
 * negative count.
 */
[[nodiscard]] CountTable build_count_table(const Eigen::VectorXi& y);

[[nodiscard]] std::size_t total_multiplicity(const CountTable& table) noexcept;

/**
 * Converts a real-valued response to integer counts, truncating toward zero.
 * Throws std::invalid_argument on negative or non-finite entries.
 */
[[nodiscard]] Eigen::VectorXi coerce_counts(const Eigen::VectorXd& values);

}  // namespace scvst
