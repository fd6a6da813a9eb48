#include "libdynfit/optimizer.hpp"

#include <Eigen/Core>
#include <LBFGS.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace libdynfit {

namespace {
[[nodiscard]] double norm2(const std::vector<double>& values) {
    double sum_sq = 0.0;
    for (double v : values) {
        sum_sq += v * v;
    }
    return std::sqrt(sum_sq);
}

[[nodiscard]] bool valid_options(const OptimizationOptions& options) {
    return options.max_iterations > 0 && options.tolerance > 0.0 && options.learning_rate > 0.0;
}

[[nodiscard]] bool gradient_converged(double gradient_norm, const std::vector<double>& parameters, double tolerance) {
    return std::isfinite(gradient_norm) && gradient_norm <= tolerance * std::max(1.0, norm2(parameters));
}
}  // namespace

std::string GradientDescentOptimizer::name() const {
    return "gradient_descent";
}

OptimizationResult GradientDescentOptimizer::optimize(const ObjectiveFunction& function,
                                                      std::vector<double> parameters,
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
    std::vector<double> gradient(result.parameters.size());
    std::vector<double> candidate(result.parameters.size());
    std::vector<double> candidate_gradient(result.parameters.size());

    double objective = function.value_and_gradient(result.parameters, gradient);
    double grad_norm = norm2(gradient);
    if (!std::isfinite(objective)) {
        result.objective_value = objective;
        result.gradient_norm = grad_norm;
        return result;
    }

    for (std::size_t iter = 0; iter < options.max_iterations; ++iter) {
        result.iterations = iter + 1;
        if (gradient_converged(grad_norm, result.parameters, options.tolerance)) {
            result.converged = true;
            break;
        }

        bool accepted = false;
        double step = step_size;
        double candidate_objective = objective;
        for (int backtrack = 0; backtrack < 30; ++backtrack) {
            for (std::size_t i = 0; i < result.parameters.size(); ++i) {
                candidate[i] = result.parameters[i] - step * gradient[i];
            }
            candidate_objective = function.value_and_gradient(candidate, candidate_gradient);
            if (std::isfinite(candidate_objective) && candidate_objective < objective) {
                accepted = true;
                break;
            }
            step *= decrease_factor;
            if (step < min_step) {
                break;
            }
        }

        if (!accepted) {
            // No descent along the gradient at any admissible step: stationary up to rounding.
            result.converged = gradient_converged(grad_norm, result.parameters, options.tolerance * 10.0);
            break;
        }

        result.parameters.swap(candidate);
        gradient.swap(candidate_gradient);
        objective = candidate_objective;
        grad_norm = norm2(gradient);
        step_size = std::min(step * increase_factor, options.learning_rate * 4.0);
    }

    result.objective_value = objective;
    result.gradient_norm = grad_norm;
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
        params_.assign(x.data(), x.data() + x.size());
        const double value = function_.value_and_gradient(params_, g_);

        if (g_.size() != static_cast<std::size_t>(grad.size())) {
            throw std::runtime_error("Gradient dimension mismatch");
        }
        for (std::size_t i = 0; i < g_.size(); ++i) {
            grad[static_cast<Eigen::Index>(i)] = g_[i];
        }
        return value;
    }

private:
    const ObjectiveFunction& function_;
    std::vector<double> params_;
    std::vector<double> g_;
};

[[nodiscard]] int to_lbfgs_linesearch(LineSearchKind kind) {
    switch (kind) {
        case LineSearchKind::Armijo:
            return LBFGSpp::LBFGS_LINESEARCH_BACKTRACKING_ARMIJO;
        case LineSearchKind::StrongWolfe:
            return LBFGSpp::LBFGS_LINESEARCH_BACKTRACKING_STRONG_WOLFE;
        case LineSearchKind::Wolfe:
            break;
    }
    return LBFGSpp::LBFGS_LINESEARCH_BACKTRACKING_WOLFE;
}
}  // namespace

std::string LBFGSOptimizer::name() const {
    return "lbfgs";
}

OptimizationResult LBFGSOptimizer::optimize(const ObjectiveFunction& function,
                                            std::vector<double> initial_parameters,
                                            const OptimizationOptions& options) const {
    if (!valid_options(options)) {
        throw std::invalid_argument("invalid optimization options");
    }

    LBFGSpp::LBFGSParam<double> param;
    param.epsilon = options.tolerance;
    param.max_iterations = static_cast<int>(options.max_iterations);
    param.m = options.m;
    param.past = options.past;
    param.delta = options.delta;
    param.max_linesearch = options.max_linesearch;
    param.linesearch = to_lbfgs_linesearch(options.linesearch);

    LBFGSpp::LBFGSSolver<double, LBFGSpp::LineSearchBacktracking> solver(param);
    LBFGSFunctor functor(function);

    Eigen::VectorXd x = Eigen::Map<Eigen::VectorXd>(initial_parameters.data(),
                                                    static_cast<Eigen::Index>(initial_parameters.size()));
    double fx = 0.0;

    int niter = 0;
    try {
        niter = solver.minimize(functor, x, fx);
    } catch (const std::exception&) {
        // LBFGSpp signals line search breakdown (typically a step into a non
        // positive definite region) by throwing. Restart from the initial
        // point with plain descent.
        GradientDescentOptimizer fallback;
        auto result = fallback.optimize(function, std::move(initial_parameters), options);
        result.used_fallback = true;
        return result;
    }

    OptimizationResult result;
    result.parameters.assign(x.data(), x.data() + x.size());
    result.objective_value = fx;
    result.iterations = static_cast<std::size_t>(niter);

    std::vector<double> final_grad = function.gradient(result.parameters);
    result.gradient_norm = norm2(final_grad);
    result.converged = gradient_converged(result.gradient_norm, result.parameters, options.tolerance);

    if (!result.converged && std::isfinite(fx)) {
        GradientDescentOptimizer fallback;
        auto polished = fallback.optimize(function, result.parameters, options);
        polished.iterations += result.iterations;
        polished.used_fallback = true;
        return polished;
    }

    return result;
}

std::unique_ptr<Optimizer> make_lbfgs_optimizer() {
    return std::make_unique<LBFGSOptimizer>();
}

}  // namespace libdynfit
