#pragma once

#include <Eigen/Core>

#include <cstddef>
#include <memory>
#include <string>

namespace scvst {

struct OptimizationOptions {
    std::size_t max_iterations{1000};
    double tolerance{1e-6};      // Gradient norm, relative to max(1, ||x||)
    double learning_rate{0.1};   // Initial step for gradient descent

    // L-BFGS specific options
    int m{6};                    // History size
    int max_linesearch{20};      // Max line search trials
    std::string linesearch_type{"strong_wolfe"}; // "armijo", "wolfe", "strong_wolfe"
};

struct OptimizationResult {
    Eigen::VectorXd parameters;
    double objective_value{0.0};
    double gradient_norm{0.0};
    std::size_t iterations{0};
    bool converged{false};
};

// Objective to be minimized.
class ObjectiveFunction {
public:
    virtual ~ObjectiveFunction() = default;

    [[nodiscard]] virtual double value(const Eigen::VectorXd& parameters) const = 0;

    [[nodiscard]] virtual Eigen::VectorXd gradient(const Eigen::VectorXd& parameters) const = 0;

    // Fused evaluation for objectives that share work between value and gradient.
    [[nodiscard]] virtual double value_and_gradient(const Eigen::VectorXd& parameters,
                                                    Eigen::VectorXd& gradient) const {
        gradient = this->gradient(parameters);
        return this->value(parameters);
    }
};

class Optimizer {
public:
    virtual ~Optimizer() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    [[nodiscard]] virtual OptimizationResult optimize(const ObjectiveFunction& function,
                                                       Eigen::VectorXd initial_parameters,
                                                       const OptimizationOptions& options) const = 0;
};

class GradientDescentOptimizer final : public Optimizer {
public:
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] OptimizationResult optimize(const ObjectiveFunction& function,
                                               Eigen::VectorXd initial_parameters,
                                               const OptimizationOptions& options) const override;
};

// L-BFGS via LBFGS++. Falls back to gradient descent from the last iterate
// when the line search fails or the gradient test is not met.
class LBFGSOptimizer final : public Optimizer {
public:
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] OptimizationResult optimize(const ObjectiveFunction& function,
                                               Eigen::VectorXd initial_parameters,
                                               const OptimizationOptions& options) const override;
};

[[nodiscard]] std::unique_ptr<Optimizer> make_gradient_descent_optimizer();

[[nodiscard]] std::unique_ptr<Optimizer> make_lbfgs_optimizer();

}  // namespace scvst
