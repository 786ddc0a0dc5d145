#include "scvst/mean_model.hpp"

#include "scvst/optimizer.hpp"
#include "scvst/poisson_outcome.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace scvst {

namespace {
void validate_design(const Eigen::VectorXi& y, const Eigen::MatrixXd& X) {
    if (y.size() == 0) {
        throw std::invalid_argument("mean model requires at least one observation");
    }
    if (X.rows() != y.size()) {
        throw std::invalid_argument("model matrix rows must match number of counts");
    }
    if (X.cols() == 0) {
        throw std::invalid_argument("model matrix must have at least one column");
    }
    if (y.minCoeff() < 0) {
        throw std::invalid_argument("Poisson mean model requires non-negative counts");
    }
    if ((y.array() == 0).all()) {
        throw std::runtime_error("Poisson mean model has no finite fit when all counts are zero");
    }
}

void check_finite(const Eigen::VectorXd& eta) {
    if (!eta.allFinite()) {
        throw std::runtime_error("Poisson mean model diverged: non-finite linear predictor");
    }
}

// ColPivHouseholderQR solves rank-deficient systems without complaint, so
// the rank is checked explicitly.
Eigen::VectorXd solve_least_squares(const Eigen::MatrixXd& A, const Eigen::VectorXd& b) {
    Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(A);
    if (qr.rank() < A.cols()) {
        throw std::runtime_error("Poisson mean model: model matrix is rank deficient");
    }
    return qr.solve(b);
}

// GLM starting point for the Poisson family: mu = (y + mean(y)) / 2.
Eigen::VectorXd initial_mu(const Eigen::VectorXi& y) {
    const Eigen::VectorXd yd = y.cast<double>();
    return ((yd.array() + yd.mean()) / 2.0).matrix();
}

void finish_fit(const Eigen::VectorXi& y, const Eigen::MatrixXd& X, MeanModelFit& fit) {
    fit.eta = X * fit.coefficients;
    check_finite(fit.eta);
    fit.mu = fit.eta.array().exp().matrix();
    fit.deviance = poisson_deviance(y, fit.mu);
    fit.log_likelihood = poisson_log_likelihood(y, fit.eta);
}

MeanModelFit fit_irls(const Eigen::VectorXi& y,
                      const Eigen::MatrixXd& X,
                      const MeanModelOptions& options) {
    const Eigen::VectorXd yd = y.cast<double>();
    Eigen::VectorXd mu = initial_mu(y);
    Eigen::VectorXd eta = mu.array().log().matrix();

    MeanModelFit fit;
    fit.coefficients = Eigen::VectorXd::Zero(X.cols());
    double prev_deviance = std::numeric_limits<double>::infinity();

    for (std::size_t iter = 0; iter < options.max_iterations; ++iter) {
        // Log link: working weight W = mu, working response z = eta + (y - mu) / mu
        const Eigen::ArrayXd sqrt_w = mu.array().sqrt();
        const Eigen::VectorXd z = eta + ((yd - mu).array() / mu.array()).matrix();

        const Eigen::MatrixXd Xw = (X.array().colwise() * sqrt_w).matrix();
        const Eigen::VectorXd zw = (z.array() * sqrt_w).matrix();
        fit.coefficients = solve_least_squares(Xw, zw);

        eta = X * fit.coefficients;
        check_finite(eta);
        mu = eta.array().exp().matrix();

        const double deviance = poisson_deviance(y, mu);
        fit.iterations = iter + 1;
        if (options.verbose) {
            std::cout << "IRLS iteration " << iter << ": deviance=" << deviance << std::endl;
        }

        if (std::abs(deviance - prev_deviance) <= options.tolerance * (std::abs(deviance) + 0.1)) {
            fit.converged = true;
            break;
        }
        prev_deviance = deviance;
    }

    finish_fit(y, X, fit);
    return fit;
}

// Negative mean Poisson log-likelihood in beta; scaling by 1/N keeps the
// gradient tolerance independent of the sample size.
class PoissonObjective final : public ObjectiveFunction {
public:
    PoissonObjective(const Eigen::VectorXi& y, const Eigen::MatrixXd& X) : y_(y), X_(X) {}

    [[nodiscard]] double value(const Eigen::VectorXd& beta) const override {
        Eigen::VectorXd grad;
        return value_and_gradient(beta, grad);
    }

    [[nodiscard]] Eigen::VectorXd gradient(const Eigen::VectorXd& beta) const override {
        Eigen::VectorXd grad;
        (void)value_and_gradient(beta, grad);
        return grad;
    }

    [[nodiscard]] double value_and_gradient(const Eigen::VectorXd& beta,
                                            Eigen::VectorXd& grad) const override {
        const Eigen::VectorXd eta = X_ * beta;
        const double n = static_cast<double>(y_.size());
        Eigen::VectorXd d_eta(y_.size());
        double loglik = 0.0;
        for (Eigen::Index i = 0; i < y_.size(); ++i) {
            const auto eval = family_.evaluate(static_cast<double>(y_[i]), eta[i]);
            loglik += eval.log_likelihood;
            d_eta[i] = eval.first_derivative;
        }
        grad = -(X_.transpose() * d_eta) / n;
        return -loglik / n;
    }

private:
    const Eigen::VectorXi& y_;
    const Eigen::MatrixXd& X_;
    PoissonOutcome family_;
};

MeanModelFit fit_direct(const Eigen::VectorXi& y,
                        const Eigen::MatrixXd& X,
                        const MeanModelOptions& options) {
    // Start from the least-squares fit of log(initial mu) on X.
    const Eigen::VectorXd beta0 = solve_least_squares(X, initial_mu(y).array().log().matrix());

    OptimizationOptions opt;
    opt.max_iterations = options.max_iterations;
    opt.tolerance = options.gradient_tolerance;

    PoissonObjective objective(y, X);
    const auto result = make_lbfgs_optimizer()->optimize(objective, beta0, opt);
    if (options.verbose) {
        std::cout << "Poisson ML: " << result.iterations << " iterations, gradient norm "
                  << result.gradient_norm << std::endl;
    }

    MeanModelFit fit;
    fit.coefficients = result.parameters;
    fit.iterations = result.iterations;
    fit.converged = result.converged;
    finish_fit(y, X, fit);
    return fit;
}
}  // namespace

MeanModelFit estimate_mean(const Eigen::VectorXi& y,
                           const Eigen::MatrixXd& model_matrix,
                           const MeanModelOptions& options) {
    validate_design(y, model_matrix);
    if (options.max_iterations == 0) {
        throw std::invalid_argument("mean model requires a positive iteration budget");
    }

    MeanModelFit fit = options.method == MeanModelMethod::Irls
                           ? fit_irls(y, model_matrix, options)
                           : fit_direct(y, model_matrix, options);

    if (!fit.converged && options.verbose) {
        std::cerr << "Poisson mean model did not converge after " << fit.iterations
                  << " iterations" << std::endl;
    }
    return fit;
}

double poisson_deviance(const Eigen::VectorXi& y, const Eigen::VectorXd& mu) {
    if (y.size() != mu.size()) {
        throw std::invalid_argument("counts and fitted means must have the same length");
    }
    double deviance = 0.0;
    for (Eigen::Index i = 0; i < y.size(); ++i) {
        deviance += PoissonOutcome::unit_deviance(static_cast<double>(y[i]), mu[i]);
    }
    return deviance;
}

double poisson_log_likelihood(const Eigen::VectorXi& y, const Eigen::VectorXd& eta) {
    if (y.size() != eta.size()) {
        throw std::invalid_argument("counts and linear predictor must have the same length");
    }
    PoissonOutcome family;
    double total = 0.0;
    for (Eigen::Index i = 0; i < y.size(); ++i) {
        total += family.evaluate(static_cast<double>(y[i]), eta[i]).log_likelihood;
    }
    return total;
}

}  // namespace scvst
