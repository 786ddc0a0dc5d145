#include "scvst/count_table.hpp"

#include <cmath>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>

namespace scvst {

namespace {
constexpr std::size_t kDenseBinFactor = 8;
constexpr std::size_t kDenseBinFloor = 4096;
}  // namespace

CountTable build_count_table(const Eigen::VectorXi& y) {
    CountTable table;
    if (y.size() == 0) {
        return table;
    }
    if (y.minCoeff() < 0) {
        throw std::invalid_argument("count table requires non-negative counts");
    }

    const auto max_value = static_cast<std::size_t>(y.maxCoeff());

    // Dense bins stay proportional to the sample; sparse counts go through an
    // ordered map instead.
    if (max_value > kDenseBinFactor * static_cast<std::size_t>(y.size()) + kDenseBinFloor) {
        std::map<int, std::size_t> bins;
        for (Eigen::Index i = 0; i < y.size(); ++i) {
            ++bins[y[i]];
        }
        table.reserve(bins.size());
        for (const auto& [value, multiplicity] : bins) {
            table.push_back(CountBin{value, multiplicity});
        }
        return table;
    }

    std::vector<std::size_t> bins(max_value + 1, 0);
    for (Eigen::Index i = 0; i < y.size(); ++i) {
        ++bins[static_cast<std::size_t>(y[i])];
    }

    for (std::size_t value = 0; value < bins.size(); ++value) {
        if (bins[value] > 0) {
            table.push_back(CountBin{static_cast<int>(value), bins[value]});
        }
    }
    return table;
}

std::size_t total_multiplicity(const CountTable& table) noexcept {
    std::size_t total = 0;
    for (const auto& bin : table) {
        total += bin.multiplicity;
    }
    return total;
}

Eigen::VectorXi coerce_counts(const Eigen::VectorXd& values) {
    Eigen::VectorXi counts(values.size());
    for (Eigen::Index i = 0; i < values.size(); ++i) {
        const double v = values[i];
        if (!std::isfinite(v) || v < 0.0) {
            throw std::invalid_argument("count at index " + std::to_string(i) +
                                        " must be non-negative and finite");
        }
        if (v > static_cast<double>(std::numeric_limits<int>::max())) {
            throw std::invalid_argument("count at index " + std::to_string(i) + " overflows int");
        }
        counts[i] = static_cast<int>(v);
    }
    return counts;
}

}  // namespace scvst
