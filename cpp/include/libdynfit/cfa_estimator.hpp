#pragma once

#include "libdynfit/cfa_objective.hpp"
#include "libdynfit/discrepancy.hpp"
#include "libdynfit/model_types.hpp"
#include "libdynfit/optimizer.hpp"
#include "libdynfit/sample_moments.hpp"

#include <Eigen/Core>

#include <cstddef>
#include <string>
#include <vector>

namespace libdynfit {

struct EstimatorOptions {
    EstimationMethod method{EstimationMethod::ML};
    OptimizationOptions optimization{};
    std::string optimizer_name{"lbfgs"};  // "lbfgs" or "gd"
};

struct FitResult {
    EstimationMethod method{EstimationMethod::ML};
    bool converged{false};
    OptimizationResult optimization;

    std::vector<std::string> parameter_names;
    std::vector<double> parameter_estimates;  // constrained scale
    std::vector<std::string> observed_names;
    std::vector<std::string> latent_names;
    CfaMatrices matrices;
    Eigen::MatrixXd implied_covariance;

    std::size_t sample_size{0};
    std::size_t free_parameters{0};

    double fmin{0.0};  // minimized discrepancy F
    double chi_square{0.0};
    double df{0.0};
    double p_value{0.0};
    double baseline_chi_square{0.0};
    double baseline_df{0.0};
    double cfi{0.0};
    double tli{0.0};
    double rmsea{0.0};
    double srmr{0.0};

    // ML only; NaN for the least squares estimators.
    double log_likelihood{0.0};
    double aic{0.0};
    double bic{0.0};
};

// Fits a CFA ModelIR to sample moments by minimizing the chosen discrepancy.
// Failure to converge (including a singular sample covariance under ML or
// GLS) is reported through FitResult::converged, never thrown.
class CfaEstimator {
public:
    explicit CfaEstimator(EstimatorOptions options = {});

    [[nodiscard]] const EstimatorOptions& options() const noexcept;

    // moments rows follow observed_variable_names(model).
    [[nodiscard]] FitResult fit(const ModelIR& model, const SampleMoments& moments) const;

    // Raw n x p data, columns in observed_variable_names(model) order.
    [[nodiscard]] FitResult fit(const ModelIR& model, const Eigen::MatrixXd& data) const;

private:
    EstimatorOptions options_;
};

// Data-driven start values: loadings 0.7 * sd, residual variances half the
// observed variance, covariances 0.
void apply_moment_start_values(ModelIR& model, const SampleMoments& moments);

// Upper tail of the chi-square distribution.
[[nodiscard]] double chi_square_upper_tail(double statistic, double df);

}  // namespace libdynfit
