#pragma once

#include "scvst/mean_model.hpp"
#include "scvst/theta_estimator.hpp"

#include <Eigen/Dense>

#include <vector>

namespace scvst {

struct FeatureFitOptions {
    MeanModelOptions mean;
    ThetaOptions theta;
};

struct FeatureFit {
    Eigen::VectorXd coefficients;
    double theta{0.0};
    ThetaStatus status{ThetaStatus::Unconverged};
    bool mean_converged{false};
    bool skipped{false};  // All-zero feature, no finite Poisson fit
};

/**
 * Fits the Poisson mean model and the NB dispersion independently for each
 * row of a features x cells count matrix. The model matrix has one row per
 * cell.
 *
 * All-zero features are skipped and reported as Unbounded. A feature with a
 * negative count throws std::invalid_argument, and a mean-model failure is
 * rethrown as std::runtime_error; both name the feature index.
 */
[[nodiscard]] std::vector<FeatureFit> fit_features(const Eigen::MatrixXi& counts,
                                                   const Eigen::MatrixXd& model_matrix,
                                                   const FeatureFitOptions& options = FeatureFitOptions());

}  // namespace scvst
