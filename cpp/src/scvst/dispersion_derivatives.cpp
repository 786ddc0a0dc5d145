#include "scvst/dispersion_derivatives.hpp"

#include "scvst/count_table.hpp"
#include "scvst/special_functions.hpp"

#include <cmath>
#include <stdexcept>

namespace scvst {

namespace {
void check_aligned(const Eigen::VectorXi& y, const Eigen::VectorXd& mu) {
    if (y.size() != mu.size()) {
        throw std::invalid_argument("counts and fitted means must have the same length");
    }
}

// sum_i f(y_i + theta). In fast mode f is evaluated once per distinct count
// (glmGamPoi-style lookup table) and weighted by its multiplicity.
template <typename SpecialFunction>
double sum_over_counts(const Eigen::VectorXi& y,
                       double theta,
                       DerivativeMode mode,
                       SpecialFunction f) {
    double total = 0.0;
    if (mode == DerivativeMode::Fast) {
        for (const auto& bin : build_count_table(y)) {
            total += f(static_cast<double>(bin.value) + theta) * static_cast<double>(bin.multiplicity);
        }
        return total;
    }
    for (Eigen::Index i = 0; i < y.size(); ++i) {
        total += f(static_cast<double>(y[i]) + theta);
    }
    return total;
}
}  // namespace

double theta_nb_score(const Eigen::VectorXi& y,
                      const Eigen::VectorXd& mu,
                      double theta,
                      DerivativeMode mode) {
    check_aligned(y, mu);
    const double n = static_cast<double>(y.size());

    const double digamma_sum =
        sum_over_counts(y, theta, mode, [](double x) { return digamma(x); });

    double mean_terms = 0.0;
    for (Eigen::Index i = 0; i < y.size(); ++i) {
        const double denom = mu[i] + theta;
        mean_terms += (static_cast<double>(y[i]) + theta) / denom + std::log(denom);
    }

    return digamma_sum - n * digamma(theta) - mean_terms + n * (std::log(theta) + 1.0);
}

double theta_nb_hessian(const Eigen::VectorXi& y,
                        const Eigen::VectorXd& mu,
                        double theta,
                        DerivativeMode mode) {
    check_aligned(y, mu);
    const double n = static_cast<double>(y.size());

    const double trigamma_sum =
        sum_over_counts(y, theta, mode, [](double x) { return trigamma(x); });

    double mean_terms = 0.0;
    for (Eigen::Index i = 0; i < y.size(); ++i) {
        const double denom = mu[i] + theta;
        mean_terms += (static_cast<double>(y[i]) + theta) / (denom * denom) - 2.0 / denom;
    }

    return trigamma_sum - n * trigamma(theta) + mean_terms + n / theta;
}

double nb_log_likelihood(const Eigen::VectorXi& y,
                         const Eigen::VectorXd& mu,
                         double theta) {
    check_aligned(y, mu);
    if (theta <= 0.0) {
        throw std::invalid_argument("negative binomial dispersion (theta) must be positive");
    }

    // lgamma(y + theta) - lgamma(theta) - lgamma(y + 1)
    //   + theta log(theta) - (theta + y) log(theta + mu) + y log(mu)
    const double log_theta = std::log(theta);
    const double lgamma_theta = std::lgamma(theta);
    double total = 0.0;
    for (Eigen::Index i = 0; i < y.size(); ++i) {
        const double yi = static_cast<double>(y[i]);
        total += std::lgamma(yi + theta) - lgamma_theta - std::lgamma(yi + 1.0) +
                 theta * log_theta - (theta + yi) * std::log(theta + mu[i]);
        if (y[i] > 0) {
            total += yi * std::log(mu[i]);
        }
    }
    return total;
}

}  // namespace scvst
