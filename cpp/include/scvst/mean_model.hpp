#pragma once

#include <Eigen/Dense>

#include <cstddef>

namespace scvst {

enum class MeanModelMethod {
    Irls,     // Iteratively reweighted least squares (GLM Fisher scoring)
    DirectML  // L-BFGS on the Poisson log-likelihood
};

struct MeanModelOptions {
    MeanModelMethod method{MeanModelMethod::Irls};
    std::size_t max_iterations{100};
    double tolerance{1e-8};           // IRLS: relative change in deviance
    double gradient_tolerance{1e-6};  // DirectML: gradient norm of the mean log-likelihood
    bool verbose{false};
};

struct MeanModelFit {
    Eigen::VectorXd coefficients;
    Eigen::VectorXd mu;   // Fitted mean per observation
    Eigen::VectorXd eta;  // Linear predictor log(mu)
    double deviance{0.0};
    double log_likelihood{0.0};
    std::size_t iterations{0};
    bool converged{false};
};

/**
 * Fits a Poisson GLM with log link: log(mu) = X * beta.
 *
 * No intercept is added; the model matrix carries one if wanted. All fitted
 * means are returned; choosing a single representative value is up to the
 * caller.
 *
 * A fit that runs out of iterations is returned with converged == false.
 * Throws std::invalid_argument on empty input, mismatched rows or negative
 * counts, and std::runtime_error when all counts are zero, the weighted
 * design is rank deficient or the linear predictor becomes non-finite.
 */
[[nodiscard]] MeanModelFit estimate_mean(const Eigen::VectorXi& y,
                                         const Eigen::MatrixXd& model_matrix,
                                         const MeanModelOptions& options = MeanModelOptions());

[[nodiscard]] double poisson_deviance(const Eigen::VectorXi& y, const Eigen::VectorXd& mu);

[[nodiscard]] double poisson_log_likelihood(const Eigen::VectorXi& y, const Eigen::VectorXd& eta);

}  // namespace scvst
