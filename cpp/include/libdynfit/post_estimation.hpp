#pragma once

#include "libdynfit/model_types.hpp"

#include <Eigen/Core>

#include <string>
#include <vector>

namespace libdynfit {

struct StandardizedEdgeResult {
    double estimate;
    double std_lv;   // latent variances scaled to 1
    double std_all;  // latent and observed variances scaled to 1
};

struct StandardizedSolution {
    // One result per edge in model.edges
    std::vector<StandardizedEdgeResult> edges;
};

struct ModelDiagnostics {
    Eigen::MatrixXd implied_covariance;

    // Residuals (Sample - Implied)
    Eigen::MatrixXd covariance_residuals;

    // Correlation Residuals: (S_ij - Sigma_ij) / sqrt(S_ii * S_jj)
    Eigen::MatrixXd correlation_residuals;

    // Standardized Root Mean Square Residual
    double srmr;
};

// Residual covariances are standardized by the residual variances, so a
// residual correlation reads as a correlation between the unique factors.
[[nodiscard]] StandardizedSolution compute_standardized_estimates(const ModelIR& model,
                                                                  const std::vector<std::string>& parameter_names,
                                                                  const std::vector<double>& parameter_values);

// sample_covariance rows follow the model's observed variables.
[[nodiscard]] ModelDiagnostics compute_model_diagnostics(const ModelIR& model,
                                                         const std::vector<std::string>& parameter_names,
                                                         const std::vector<double>& parameter_values,
                                                         const Eigen::MatrixXd& sample_covariance);

// Bentler's SRMR: root mean square of (S_ij - Sigma_ij) / sqrt(S_ii S_jj)
// over the lower triangle including the diagonal.
[[nodiscard]] double standardized_rmr(const Eigen::MatrixXd& sample_covariance,
                                      const Eigen::MatrixXd& implied_covariance);

}  // namespace libdynfit
