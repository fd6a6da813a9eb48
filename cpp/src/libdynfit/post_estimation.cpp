#include "libdynfit/post_estimation.hpp"

#include "libdynfit/cfa_objective.hpp"

#include <cmath>
#include <stdexcept>
#include <unordered_map>

namespace libdynfit {

namespace {

[[nodiscard]] CfaMatrices assemble_named(const CfaParameterization& parameterization,
                                         const std::vector<std::string>& parameter_names,
                                         const std::vector<double>& parameter_values) {
    if (parameter_names.size() != parameter_values.size()) {
        throw std::invalid_argument("parameter names and values differ in length");
    }
    const auto& catalog = parameterization.catalog();
    std::vector<double> constrained(catalog.size(), 0.0);
    std::vector<bool> seen(catalog.size(), false);
    for (std::size_t i = 0; i < parameter_names.size(); ++i) {
        const std::size_t index = catalog.find_index(parameter_names[i]);
        if (index == ParameterCatalog::npos) {
            throw std::invalid_argument("unknown parameter: " + parameter_names[i]);
        }
        constrained[index] = parameter_values[i];
        seen[index] = true;
    }
    for (std::size_t i = 0; i < seen.size(); ++i) {
        if (!seen[i]) {
            throw std::invalid_argument("missing value for parameter: " + catalog.names()[i]);
        }
    }
    return parameterization.assemble(constrained);
}

[[nodiscard]] Eigen::VectorXd inverse_sqrt_diagonal(const Eigen::MatrixXd& matrix) {
    Eigen::VectorXd scale(matrix.rows());
    for (Eigen::Index i = 0; i < matrix.rows(); ++i) {
        const double v = matrix(i, i);
        scale(i) = v > 0.0 ? 1.0 / std::sqrt(v) : 0.0;
    }
    return scale;
}

}  // namespace

StandardizedSolution compute_standardized_estimates(const ModelIR& model,
                                                    const std::vector<std::string>& parameter_names,
                                                    const std::vector<double>& parameter_values) {
    const CfaParameterization parameterization(model);
    const CfaMatrices m = assemble_named(parameterization, parameter_names, parameter_values);
    const Eigen::MatrixXd sigma = m.implied_covariance();

    std::unordered_map<std::string, Eigen::Index> observed;
    std::unordered_map<std::string, Eigen::Index> latent;
    for (std::size_t i = 0; i < parameterization.observed_names().size(); ++i) {
        observed.emplace(parameterization.observed_names()[i], static_cast<Eigen::Index>(i));
    }
    for (std::size_t i = 0; i < parameterization.latent_names().size(); ++i) {
        latent.emplace(parameterization.latent_names()[i], static_cast<Eigen::Index>(i));
    }

    const Eigen::VectorXd obs_scale = inverse_sqrt_diagonal(sigma);
    const Eigen::VectorXd lat_scale = inverse_sqrt_diagonal(m.phi);
    const Eigen::VectorXd res_scale = inverse_sqrt_diagonal(m.theta);

    StandardizedSolution solution;
    solution.edges.reserve(model.edges.size());
    for (const auto& edge : model.edges) {
        StandardizedEdgeResult result{0.0, 0.0, 0.0};
        if (edge.kind == EdgeKind::Loading) {
            const Eigen::Index i = observed.at(edge.target);
            const Eigen::Index f = latent.at(edge.source);
            result.estimate = m.lambda(i, f);
            result.std_lv = lat_scale(f) > 0.0 ? result.estimate / lat_scale(f) : 0.0;
            result.std_all = result.std_lv * obs_scale(i);
        } else if (latent.contains(edge.source)) {
            const Eigen::Index f = latent.at(edge.source);
            const Eigen::Index g = latent.at(edge.target);
            result.estimate = m.phi(f, g);
            result.std_lv = result.estimate * lat_scale(f) * lat_scale(g);
            result.std_all = result.std_lv;
        } else {
            const Eigen::Index i = observed.at(edge.source);
            const Eigen::Index j = observed.at(edge.target);
            result.estimate = m.theta(i, j);
            result.std_lv = result.estimate;
            if (i == j) {
                result.std_all = result.estimate * obs_scale(i) * obs_scale(i);
            } else {
                result.std_all = result.estimate * res_scale(i) * res_scale(j);
            }
        }
        solution.edges.push_back(result);
    }
    return solution;
}

double standardized_rmr(const Eigen::MatrixXd& sample_covariance, const Eigen::MatrixXd& implied_covariance) {
    if (sample_covariance.rows() != implied_covariance.rows() || sample_covariance.cols() != implied_covariance.cols()) {
        throw std::invalid_argument("sample and implied covariance differ in size");
    }
    const Eigen::VectorXd scale = inverse_sqrt_diagonal(sample_covariance);
    const Eigen::Index p = sample_covariance.rows();
    double sum_sq = 0.0;
    for (Eigen::Index c = 0; c < p; ++c) {
        for (Eigen::Index r = c; r < p; ++r) {
            const double resid = (sample_covariance(r, c) - implied_covariance(r, c)) * scale(r) * scale(c);
            sum_sq += resid * resid;
        }
    }
    return std::sqrt(sum_sq / static_cast<double>(p * (p + 1) / 2));
}

ModelDiagnostics compute_model_diagnostics(const ModelIR& model,
                                           const std::vector<std::string>& parameter_names,
                                           const std::vector<double>& parameter_values,
                                           const Eigen::MatrixXd& sample_covariance) {
    const CfaParameterization parameterization(model);
    const CfaMatrices m = assemble_named(parameterization, parameter_names, parameter_values);

    ModelDiagnostics diag;
    diag.implied_covariance = m.implied_covariance();
    if (sample_covariance.rows() != diag.implied_covariance.rows() ||
        sample_covariance.cols() != diag.implied_covariance.cols()) {
        throw std::invalid_argument("sample covariance does not match the model's observed variables");
    }
    diag.covariance_residuals = sample_covariance - diag.implied_covariance;

    const Eigen::VectorXd scale = inverse_sqrt_diagonal(sample_covariance);
    diag.correlation_residuals = scale.asDiagonal() * diag.covariance_residuals * scale.asDiagonal();
    diag.srmr = standardized_rmr(sample_covariance, diag.implied_covariance);
    return diag;
}

}  // namespace libdynfit
