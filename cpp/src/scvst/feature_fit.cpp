#include "scvst/feature_fit.hpp"

#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

namespace scvst {

std::vector<FeatureFit> fit_features(const Eigen::MatrixXi& counts,
                                     const Eigen::MatrixXd& model_matrix,
                                     const FeatureFitOptions& options) {
    if (counts.cols() != model_matrix.rows()) {
        throw std::invalid_argument("count matrix columns must match model matrix rows");
    }

    std::vector<FeatureFit> fits;
    fits.reserve(static_cast<std::size_t>(counts.rows()));

    for (Eigen::Index f = 0; f < counts.rows(); ++f) {
        const Eigen::VectorXi y = counts.row(f).transpose();
        FeatureFit fit;

        if (y.size() > 0 && y.minCoeff() < 0) {
            throw std::invalid_argument("feature " + std::to_string(f) + ": counts must be non-negative");
        }
        if ((y.array() == 0).all()) {
            fit.theta = std::numeric_limits<double>::infinity();
            fit.status = ThetaStatus::Unbounded;
            fit.skipped = true;
            fits.push_back(fit);
            continue;
        }

        MeanModelFit mean;
        try {
            mean = estimate_mean(y, model_matrix, options.mean);
        } catch (const std::runtime_error& e) {
            throw std::runtime_error("feature " + std::to_string(f) + ": " + e.what());
        }

        const ThetaFit theta = fit_theta(y, mean.mu, options.theta);
        fit.coefficients = mean.coefficients;
        fit.mean_converged = mean.converged;
        fit.theta = theta.theta;
        fit.status = theta.status;

        if (options.mean.verbose || options.theta.verbose) {
            std::cout << "feature " << f << ": theta=" << fit.theta << " (" << to_string(fit.status)
                      << ")" << std::endl;
        }
        fits.push_back(fit);
    }
    return fits;
}

}  // namespace scvst
