#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace libdynfit {

enum class LineSearchKind {
    Armijo,
    Wolfe,
    StrongWolfe
};

struct OptimizationOptions {
    std::size_t max_iterations{500};
    // Convergence when ||g|| <= tolerance * max(1, ||x||).
    double tolerance{1e-5};
    double learning_rate{0.1};

    // L-BFGS specific options
    int m{6};  // History size
    int past{0};
    double delta{0.0};
    int max_linesearch{40};
    LineSearchKind linesearch{LineSearchKind::Wolfe};
};

struct OptimizationResult {
    std::vector<double> parameters;
    double objective_value{0.0};
    double gradient_norm{0.0};
    std::size_t iterations{0};
    bool converged{false};
    bool used_fallback{false};
};

class ObjectiveFunction {
public:
    virtual ~ObjectiveFunction() = default;

    [[nodiscard]] virtual double value(const std::vector<double>& parameters) const = 0;

    [[nodiscard]] virtual std::vector<double> gradient(const std::vector<double>& parameters) const = 0;

    // Fused evaluation; objectives that share work between value and gradient override this.
    [[nodiscard]] virtual double value_and_gradient(const std::vector<double>& parameters,
                                                    std::vector<double>& gradient) const {
        gradient = this->gradient(parameters);
        return this->value(parameters);
    }
};

class Optimizer {
public:
    virtual ~Optimizer() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    [[nodiscard]] virtual OptimizationResult optimize(const ObjectiveFunction& function,
                                                       std::vector<double> initial_parameters,
                                                       const OptimizationOptions& options) const = 0;
};

class GradientDescentOptimizer final : public Optimizer {
public:
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] OptimizationResult optimize(const ObjectiveFunction& function,
                                               std::vector<double> initial_parameters,
                                               const OptimizationOptions& options) const override;
};

// L-BFGS with backtracking line search. Falls back to gradient descent when
// the line search fails or the solver stops short of the tolerance.
class LBFGSOptimizer final : public Optimizer {
public:
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] OptimizationResult optimize(const ObjectiveFunction& function,
                                               std::vector<double> initial_parameters,
                                               const OptimizationOptions& options) const override;
};

[[nodiscard]] std::unique_ptr<Optimizer> make_gradient_descent_optimizer();

[[nodiscard]] std::unique_ptr<Optimizer> make_lbfgs_optimizer();

}  // namespace libdynfit
