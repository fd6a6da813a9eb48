#include "libdynfit/cfa_estimator.hpp"

#include "libdynfit/post_estimation.hpp"

#include <unsupported/Eigen/SpecialFunctions>
#include <Eigen/Cholesky>

#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>
#include <numbers>
#include <stdexcept>
#include <unordered_map>

namespace libdynfit {

namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

[[nodiscard]] FitResult unconverged_result(EstimationMethod method, const CfaParameterization& parameterization,
                                           std::size_t sample_size) {
    FitResult result;
    result.method = method;
    result.converged = false;
    result.parameter_names = parameterization.catalog().names();
    result.observed_names = parameterization.observed_names();
    result.latent_names = parameterization.latent_names();
    result.sample_size = sample_size;
    result.free_parameters = parameterization.catalog().size();
    result.fmin = kNaN;
    result.chi_square = kNaN;
    result.p_value = kNaN;
    result.baseline_chi_square = kNaN;
    result.cfi = kNaN;
    result.tli = kNaN;
    result.rmsea = kNaN;
    result.srmr = kNaN;
    result.log_likelihood = kNaN;
    result.aic = kNaN;
    result.bic = kNaN;
    return result;
}

void compute_fit_indices(FitResult& result, const DiscrepancyFunction& discrepancy, const SampleMoments& moments) {
    const auto p = static_cast<double>(moments.covariance.rows());
    const auto n = static_cast<double>(moments.sample_size);
    const auto q = static_cast<double>(result.free_parameters);

    result.df = p * (p + 1.0) / 2.0 - q;
    result.chi_square = n * result.fmin;
    result.p_value = chi_square_upper_tail(result.chi_square, result.df);

    result.baseline_df = p * (p - 1.0) / 2.0;
    result.baseline_chi_square = n * discrepancy.baseline_value();

    const double excess = std::max(result.chi_square - result.df, 0.0);
    const double baseline_excess = std::max(result.baseline_chi_square - result.baseline_df, 0.0);
    const double denominator = std::max(excess, baseline_excess);
    result.cfi = denominator > 0.0 ? 1.0 - excess / denominator : 1.0;

    if (result.df > 0.0 && result.baseline_df > 0.0) {
        const double baseline_ratio = result.baseline_chi_square / result.baseline_df;
        const double ratio = result.chi_square / result.df;
        result.tli = baseline_ratio > 1.0 ? (baseline_ratio - ratio) / (baseline_ratio - 1.0) : 1.0;
        result.rmsea = std::sqrt(excess / (result.df * n));
    } else {
        result.tli = 1.0;
        result.rmsea = 0.0;
    }

    result.srmr = standardized_rmr(moments.covariance, result.implied_covariance);

    if (result.method == EstimationMethod::ML) {
        Eigen::LLT<Eigen::MatrixXd> llt(result.implied_covariance);
        const double log_det = 2.0 * llt.matrixLLT().diagonal().array().log().sum();
        const double trace = llt.solve(moments.covariance).trace();
        result.log_likelihood = -0.5 * n * (p * std::log(2.0 * std::numbers::pi) + log_det + trace);
        result.aic = -2.0 * result.log_likelihood + 2.0 * q;
        result.bic = -2.0 * result.log_likelihood + q * std::log(n);
    } else {
        result.log_likelihood = kNaN;
        result.aic = kNaN;
        result.bic = kNaN;
    }
}
}  // namespace

double chi_square_upper_tail(double statistic, double df) {
    if (!(df > 0.0) || !std::isfinite(statistic)) {
        return kNaN;
    }
    if (statistic <= 0.0) {
        return 1.0;
    }
    return Eigen::numext::igammac(0.5 * df, 0.5 * statistic);
}

void apply_moment_start_values(ModelIR& model, const SampleMoments& moments) {
    const auto observed = observed_variable_names(model);
    if (static_cast<Eigen::Index>(observed.size()) != moments.covariance.rows()) {
        throw std::invalid_argument("sample moments do not match the model's observed variables");
    }
    std::unordered_map<std::string, double> variance;
    for (std::size_t i = 0; i < observed.size(); ++i) {
        const auto k = static_cast<Eigen::Index>(i);
        variance[observed[i]] = moments.covariance(k, k);
    }

    std::unordered_map<std::string, double> start;
    for (const auto& edge : model.edges) {
        if (edge.kind == EdgeKind::Loading) {
            start.emplace(edge.parameter_id, 0.7 * std::sqrt(std::max(variance.at(edge.target), 1e-8)));
        } else if (edge.source == edge.target && variance.contains(edge.source)) {
            start.emplace(edge.parameter_id, 0.5 * std::max(variance.at(edge.source), 1e-8));
        } else if (edge.source == edge.target) {
            start.emplace(edge.parameter_id, 1.0);
        } else {
            start.emplace(edge.parameter_id, 0.0);
        }
    }
    for (auto& param : model.parameters) {
        if (param.constraint == ParameterConstraint::Fixed) {
            continue;
        }
        if (auto it = start.find(param.id); it != start.end()) {
            param.initial_value = it->second;
        }
    }
}

CfaEstimator::CfaEstimator(EstimatorOptions options) : options_(std::move(options)) {
    if (options_.optimizer_name != "lbfgs" && options_.optimizer_name != "gd") {
        throw std::invalid_argument("unknown optimizer: " + options_.optimizer_name);
    }
}

const EstimatorOptions& CfaEstimator::options() const noexcept {
    return options_;
}

FitResult CfaEstimator::fit(const ModelIR& model, const SampleMoments& moments) const {
    const CfaParameterization parameterization(model);
    const auto p = static_cast<Eigen::Index>(parameterization.observed_names().size());
    if (moments.covariance.rows() != p || moments.covariance.cols() != p) {
        throw std::invalid_argument("sample moments do not match the model's observed variables");
    }

    std::unique_ptr<DiscrepancyFunction> discrepancy;
    try {
        discrepancy = make_discrepancy(options_.method, moments);
    } catch (const std::domain_error&) {
        return unconverged_result(options_.method, parameterization, moments.sample_size);
    }

    // Start values that imply a non positive definite Sigma are replaced by
    // data-driven ones.
    ModelIR working = model;
    {
        const CfaObjective start(working, *discrepancy);
        if (!std::isfinite(start.value(start.initial_parameters()))) {
            apply_moment_start_values(working, moments);
        }
    }
    const CfaObjective objective(working, *discrepancy);

    std::unique_ptr<Optimizer> optimizer;
    if (options_.optimizer_name == "lbfgs") {
        optimizer = make_lbfgs_optimizer();
    } else {
        optimizer = make_gradient_descent_optimizer();
    }
    OptimizationResult opt = optimizer->optimize(objective, objective.initial_parameters(), options_.optimization);

    FitResult result = unconverged_result(options_.method, parameterization, moments.sample_size);
    result.optimization = opt;
    result.parameter_estimates = objective.to_constrained(opt.parameters);
    result.matrices = parameterization.assemble(result.parameter_estimates);
    result.implied_covariance = result.matrices.implied_covariance();
    result.fmin = opt.objective_value;
    result.converged = opt.converged && std::isfinite(opt.objective_value);
    if (!result.converged) {
        return result;
    }

    compute_fit_indices(result, *discrepancy, moments);
    return result;
}

FitResult CfaEstimator::fit(const ModelIR& model, const Eigen::MatrixXd& data) const {
    return fit(model, compute_sample_moments(data, requires_fourth_order(options_.method)));
}

}  // namespace libdynfit
