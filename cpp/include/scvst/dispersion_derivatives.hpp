#pragma once

#include <Eigen/Core>

namespace scvst {

// How the special-function terms of the theta derivatives are summed.
//   Fast:  once per distinct count, weighted by its multiplicity.
//   Exact: once per observation.
// Both give the same value up to floating-point rounding.
enum class DerivativeMode {
    Fast,
    Exact
};

/**
 * First derivative of the NB log-likelihood with respect to theta:
 *
 *   sum_i [ digamma(y_i + theta) - digamma(theta) - (y_i + theta) / (mu_i + theta)
 *           + log(theta) - log(mu_i + theta) + 1 ]
 *
 * mu_i > 0 and theta > 0 are preconditions; out-of-domain values propagate
 * as NaN or Inf. Throws std::invalid_argument when y and mu differ in length.
 */
[[nodiscard]] double theta_nb_score(const Eigen::VectorXi& y,
                                    const Eigen::VectorXd& mu,
                                    double theta,
                                    DerivativeMode mode = DerivativeMode::Fast);

/**
 * Second derivative of the NB log-likelihood with respect to theta:
 *
 *   sum_i [ trigamma(y_i + theta) - trigamma(theta) + (y_i + theta) / (mu_i + theta)^2
 *           + 1 / theta - 2 / (mu_i + theta) ]
 */
[[nodiscard]] double theta_nb_hessian(const Eigen::VectorXi& y,
                                      const Eigen::VectorXd& mu,
                                      double theta,
                                      DerivativeMode mode = DerivativeMode::Fast);

// Total NB2 log-likelihood at (mu, theta). Throws std::invalid_argument for
// misaligned inputs or theta <= 0.
[[nodiscard]] double nb_log_likelihood(const Eigen::VectorXi& y,
                                       const Eigen::VectorXd& mu,
                                       double theta);

}  // namespace scvst
