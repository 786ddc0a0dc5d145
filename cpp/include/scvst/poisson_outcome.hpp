#pragma once

namespace scvst {

// Per-observation log-likelihood and its derivative with respect to the
// linear predictor eta = log(mu).
struct OutcomeEvaluation {
    double log_likelihood{0.0};
    double first_derivative{0.0};
};

class PoissonOutcome {
public:
    [[nodiscard]] OutcomeEvaluation evaluate(double observed, double linear_predictor) const;

    // Unit deviance 2 * (y log(y / mu) - (y - mu)), with the y == 0 limit 2 mu.
    [[nodiscard]] static double unit_deviance(double observed, double mean);
};

}  // namespace scvst
