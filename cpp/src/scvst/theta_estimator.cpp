#include "scvst/theta_estimator.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace scvst {

namespace {
constexpr double kInfinity = std::numeric_limits<double>::infinity();

ThetaFit unbounded(std::size_t iterations, double score) {
    ThetaFit fit;
    fit.theta = kInfinity;
    fit.status = ThetaStatus::Unbounded;
    fit.iterations = iterations;
    fit.score = score;
    return fit;
}
}  // namespace

std::string to_string(ThetaStatus status) {
    switch (status) {
        case ThetaStatus::Converged:
            return "converged";
        case ThetaStatus::Unbounded:
            return "unbounded";
        case ThetaStatus::Unconverged:
            return "unconverged";
    }
    return "unknown";
}

void validate_dispersion_inputs(const Eigen::VectorXi& y, const Eigen::VectorXd& mu) {
    if (y.size() == 0) {
        throw std::invalid_argument("dispersion estimation requires at least one observation");
    }
    if (y.size() != mu.size()) {
        throw std::invalid_argument("counts and fitted means must have the same length");
    }
    if (y.minCoeff() < 0) {
        throw std::invalid_argument("counts must be non-negative");
    }
    for (Eigen::Index i = 0; i < mu.size(); ++i) {
        if (!std::isfinite(mu[i]) || mu[i] <= 0.0) {
            throw std::invalid_argument("fitted means must be positive and finite");
        }
    }
}

double moment_theta(const Eigen::VectorXi& y, const Eigen::VectorXd& mu) {
    if (y.size() != mu.size()) {
        throw std::invalid_argument("counts and fitted means must have the same length");
    }
    double denom = 0.0;
    for (Eigen::Index i = 0; i < y.size(); ++i) {
        const double r = static_cast<double>(y[i]) / mu[i] - 1.0;
        denom += r * r;
    }
    return static_cast<double>(y.size()) / denom;
}

ThetaFit fit_theta(const Eigen::VectorXi& y,
                   const Eigen::VectorXd& mu,
                   const ThetaOptions& options) {
    if (options.validate_inputs) {
        validate_dispersion_inputs(y, mu);
    }

    double theta = moment_theta(y, mu);
    if (options.verbose) {
        std::cout << "theta: moment estimate " << theta << " from " << y.size() << " observations"
                  << std::endl;
    }
    // y == mu everywhere: no overdispersion to estimate.
    if (theta == kInfinity) {
        return unbounded(0, 0.0);
    }

    ThetaFit fit;
    for (std::size_t iter = 0; iter < options.max_iterations; ++iter) {
        theta = std::abs(theta);

        const double score = theta_nb_score(y, mu, theta, options.mode);
        fit.iterations = iter + 1;
        fit.score = score;

        // Log-likelihood already decreasing: no interior maximum reachable.
        if (score < 0) {
            if (options.verbose) {
                std::cout << "theta: iteration " << iter << " score " << score
                          << " < 0 at theta " << theta << ", unbounded" << std::endl;
            }
            return unbounded(fit.iterations, score);
        }

        const double hessian = theta_nb_hessian(y, mu, theta, options.mode);
        const double delta = score / hessian;
        theta -= delta;

        if (options.verbose) {
            std::cout << "theta: iteration " << iter << " score=" << score << " hessian=" << hessian
                      << " theta=" << theta << std::endl;
        }

        if (std::abs(delta) <= options.tolerance) {
            fit.theta = theta;
            fit.status = ThetaStatus::Converged;
            return fit;
        }
    }

    if (theta < 0) {
        return unbounded(fit.iterations, fit.score);
    }

    if (options.verbose) {
        std::cerr << "theta: no convergence after " << options.max_iterations
                  << " iterations, returning " << theta << std::endl;
    }
    fit.theta = theta;
    fit.status = ThetaStatus::Unconverged;
    return fit;
}

double estimate_dispersion(const Eigen::VectorXi& y,
                           const Eigen::VectorXd& mu,
                           std::size_t max_iterations,
                           double tolerance) {
    ThetaOptions options;
    options.max_iterations = max_iterations;
    options.tolerance = tolerance;
    return fit_theta(y, mu, options).theta;
}

}  // namespace scvst
