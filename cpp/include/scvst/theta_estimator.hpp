#pragma once

#include "scvst/dispersion_derivatives.hpp"

#include <Eigen/Core>

#include <cstddef>
#include <string>

namespace scvst {

enum class ThetaStatus {
    Converged,    // Newton step fell below tolerance
    Unbounded,    // no finite maximum; theta is +infinity (Poisson limit)
    Unconverged   // iteration budget exhausted; theta is the last iterate
};

[[nodiscard]] std::string to_string(ThetaStatus status);

struct ThetaOptions {
    std::size_t max_iterations{20};
    double tolerance{1e-4};
    DerivativeMode mode{DerivativeMode::Fast};
    bool validate_inputs{false};  // Throw on malformed counts or means instead of propagating NaN
    bool verbose{false};          // Print one line per Newton iteration
};

struct ThetaFit {
    double theta{0.0};
    ThetaStatus status{ThetaStatus::Unconverged};
    std::size_t iterations{0};  // Score evaluations performed
    double score{0.0};          // Score at the last evaluated theta

    [[nodiscard]] bool converged() const noexcept { return status == ThetaStatus::Converged; }
};

/**
 * Method-of-moments starting value N / sum_i (y_i / mu_i - 1)^2.
 *
 * Returns +infinity when every y_i equals mu_i. Throws std::invalid_argument
 * when y and mu differ in length.
 */
[[nodiscard]] double moment_theta(const Eigen::VectorXi& y, const Eigen::VectorXd& mu);

/**
 * Maximum-likelihood NB dispersion by Newton-Raphson on the theta score.
 *
 * Starting from moment_theta, each iteration takes |theta|, evaluates the
 * score and stops with Unbounded as soon as it is negative. Otherwise it
 * applies theta -= score / hessian and stops with Converged once the step is
 * within tolerance. If the budget runs out, a negative final theta is
 * reported as Unbounded and anything else as Unconverged.
 *
 * With options.validate_inputs, throws std::invalid_argument for empty or
 * misaligned input, negative counts and non-positive or non-finite means.
 */
[[nodiscard]] ThetaFit fit_theta(const Eigen::VectorXi& y,
                                 const Eigen::VectorXd& mu,
                                 const ThetaOptions& options = ThetaOptions());

// Scalar form of fit_theta: theta in (0, inf], inf meaning unbounded.
[[nodiscard]] double estimate_dispersion(const Eigen::VectorXi& y,
                                         const Eigen::VectorXd& mu,
                                         std::size_t max_iterations = 20,
                                         double tolerance = 1e-4);

void validate_dispersion_inputs(const Eigen::VectorXi& y, const Eigen::VectorXd& mu);

}  // namespace scvst
