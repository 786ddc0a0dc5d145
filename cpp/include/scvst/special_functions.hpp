#pragma once

#include <Eigen/Core>

namespace scvst {

// Polygamma functions of order 0 and 1. Arguments outside the domain
// (poles at zero and the negative integers, NaN) evaluate to NaN.
[[nodiscard]] double digamma(double x);

[[nodiscard]] double trigamma(double x);

[[nodiscard]] Eigen::ArrayXd digamma(const Eigen::ArrayXd& x);

[[nodiscard]] Eigen::ArrayXd trigamma(const Eigen::ArrayXd& x);

}  // namespace scvst
