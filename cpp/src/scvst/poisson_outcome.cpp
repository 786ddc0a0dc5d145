#include "scvst/poisson_outcome.hpp"

#include <cmath>
#include <stdexcept>

namespace scvst {

OutcomeEvaluation PoissonOutcome::evaluate(double observed, double linear_predictor) const {
    if (observed < 0.0) {
        throw std::invalid_argument("Poisson observed value must be non-negative");
    }

    // mu = exp(eta)
    const double mu = std::exp(linear_predictor);

    // log_lik = y * eta - mu - log(y!)
    OutcomeEvaluation eval;
    eval.log_likelihood = observed * linear_predictor - mu - std::lgamma(observed + 1.0);
    eval.first_derivative = observed - mu;
    return eval;
}

double PoissonOutcome::unit_deviance(double observed, double mean) {
    if (observed == 0.0) {
        return 2.0 * mean;
    }
    return 2.0 * (observed * std::log(observed / mean) - (observed - mean));
}

}  // namespace scvst
