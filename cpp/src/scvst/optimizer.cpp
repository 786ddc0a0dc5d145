#include "scvst/optimizer.hpp"

#include <LBFGS.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace scvst {

namespace {
[[nodiscard]] bool valid_options(const OptimizationOptions& options) {
    return options.max_iterations > 0 && options.tolerance > 0.0 && options.learning_rate > 0.0;
}

[[nodiscard]] bool gradient_converged(double gradient_norm,
                                      const Eigen::VectorXd& parameters,
                                      double tolerance) {
    return gradient_norm <= tolerance * std::max(1.0, parameters.norm());
}
}  // namespace

std::string GradientDescentOptimizer::name() const {
    return "gradient_descent";
}

OptimizationResult GradientDescentOptimizer::optimize(const ObjectiveFunction& function,
                                                      Eigen::VectorXd parameters,
                                                      const OptimizationOptions& options) const {
    if (!valid_options(options)) {
        throw std::invalid_argument("invalid optimization options");
    }
    OptimizationResult result;
    result.parameters = std::move(parameters);

    const double decrease_factor = 0.5;
    const double increase_factor = 1.05;
    const double min_step = 1e-10;
    double step_size = options.learning_rate;

    Eigen::VectorXd gradient(result.parameters.size());
    Eigen::VectorXd candidate(result.parameters.size());
    Eigen::VectorXd candidate_gradient(result.parameters.size());
    double objective = function.value_and_gradient(result.parameters, gradient);

    for (std::size_t iter = 0; iter < options.max_iterations; ++iter) {
        const double grad_norm = gradient.norm();
        result.iterations = iter + 1;
        result.gradient_norm = grad_norm;
        result.objective_value = objective;

        if (gradient_converged(grad_norm, result.parameters, options.tolerance)) {
            result.converged = true;
            break;
        }

        bool accepted = false;
        double step = step_size;
        double candidate_objective = objective;
        for (int backtrack = 0; backtrack < 20; ++backtrack) {
            candidate = result.parameters - step * gradient;
            candidate_objective = function.value_and_gradient(candidate, candidate_gradient);
            // Armijo sufficient decrease
            if (std::isfinite(candidate_objective) &&
                candidate_objective <= objective - 1e-4 * step * grad_norm * grad_norm) {
                accepted = true;
                break;
            }
            step *= decrease_factor;
            if (step < min_step) {
                break;
            }
        }

        if (!accepted) {
            break;  // no descent possible at machine precision
        }

        result.parameters = candidate;
        gradient = candidate_gradient;
        objective = candidate_objective;
        step_size = std::min(step * increase_factor, options.learning_rate * 4.0);
    }

    result.objective_value = objective;
    result.gradient_norm = gradient.norm();
    result.converged = gradient_converged(result.gradient_norm, result.parameters, options.tolerance);
    return result;
}

std::unique_ptr<Optimizer> make_gradient_descent_optimizer() {
    return std::make_unique<GradientDescentOptimizer>();
}

namespace {
class LBFGSFunctor {
public:
    explicit LBFGSFunctor(const ObjectiveFunction& function) : function_(function) {}

    double operator()(const Eigen::VectorXd& x, Eigen::VectorXd& grad) {
        Eigen::VectorXd g(x.size());
        const double value = function_.value_and_gradient(x, g);
        if (g.size() != grad.size()) {
            throw std::runtime_error("Gradient dimension mismatch");
        }
        grad = g;
        if (std::isfinite(value) && value < best_value_) {
            best_value_ = value;
            best_parameters_ = x;
        }
        return value;
    }

    // Lowest-objective point evaluated so far; empty before the first call.
    [[nodiscard]] const Eigen::VectorXd& best_parameters() const { return best_parameters_; }

private:
    const ObjectiveFunction& function_;
    double best_value_{std::numeric_limits<double>::infinity()};
    Eigen::VectorXd best_parameters_;
};
}  // namespace

std::string LBFGSOptimizer::name() const {
    return "lbfgs";
}

OptimizationResult LBFGSOptimizer::optimize(const ObjectiveFunction& function,
                                            Eigen::VectorXd initial_parameters,
                                            const OptimizationOptions& options) const {
    if (!valid_options(options)) {
        throw std::invalid_argument("invalid optimization options");
    }

    LBFGSpp::LBFGSParam<double> param;
    param.epsilon = options.tolerance;
    param.max_iterations = static_cast<int>(options.max_iterations);
    param.m = options.m;
    param.max_linesearch = options.max_linesearch;

    if (options.linesearch_type == "armijo") {
        param.linesearch = LBFGSpp::LBFGS_LINESEARCH_BACKTRACKING_ARMIJO;
    } else if (options.linesearch_type == "wolfe") {
        param.linesearch = LBFGSpp::LBFGS_LINESEARCH_BACKTRACKING_WOLFE;
    } else if (options.linesearch_type == "strong_wolfe") {
        param.linesearch = LBFGSpp::LBFGS_LINESEARCH_BACKTRACKING_STRONG_WOLFE;
    } else {
        throw std::invalid_argument("unknown line search: " + options.linesearch_type);
    }

    LBFGSpp::LBFGSSolver<double> solver(param);
    LBFGSFunctor functor(function);

    Eigen::VectorXd x = std::move(initial_parameters);
    double fx = 0.0;
    int niter = 0;
    try {
        niter = solver.minimize(functor, x, fx);
    } catch (const std::exception&) {
        // Line search breakdown, typically close to the optimum. x then holds
        // the rejected trial point, so finish with gradient descent from the
        // best point evaluated.
        GradientDescentOptimizer fallback;
        const Eigen::VectorXd& restart = functor.best_parameters();
        return fallback.optimize(function, restart.size() == x.size() ? restart : x, options);
    }

    OptimizationResult result;
    result.parameters = x;
    result.objective_value = fx;
    result.iterations = static_cast<std::size_t>(niter);
    result.gradient_norm = function.gradient(result.parameters).norm();
    result.converged = gradient_converged(result.gradient_norm, result.parameters, options.tolerance);

    if (!result.converged) {
        GradientDescentOptimizer fallback;
        return fallback.optimize(function, result.parameters, options);
    }
    return result;
}

std::unique_ptr<Optimizer> make_lbfgs_optimizer() {
    return std::make_unique<LBFGSOptimizer>();
}

}  // namespace scvst
