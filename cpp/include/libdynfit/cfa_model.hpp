#pragma once

#include "libdynfit/model_types.hpp"

#include <cstddef>
#include <limits>
#include <string>
#include <vector>

namespace libdynfit {

struct IndicatorSpec {
    std::string item;
    double loading{0.0};
};

struct FactorSpec {
    std::string name;
    std::vector<IndicatorSpec> indicators;
};

// Undirected pair; for factors a correlation, for items a residual correlation.
struct CorrelationSpec {
    std::string left;
    std::string right;
    double value{0.0};
};

// Standardized multi-factor CFA model. Factor pairs without an entry in
// factor_correlations are uncorrelated in the population.
struct CfaModelSpec {
    std::vector<FactorSpec> factors;
    std::vector<CorrelationSpec> factor_correlations;
    std::vector<CorrelationSpec> residual_correlations;
};

inline constexpr std::size_t kNoFactor = std::numeric_limits<std::size_t>::max();

// Items in order of first appearance across the factor declarations.
[[nodiscard]] std::vector<std::string> observed_items(const CfaModelSpec& spec);

[[nodiscard]] std::size_t factor_count(const CfaModelSpec& spec) noexcept;

[[nodiscard]] std::size_t find_factor(const CfaModelSpec& spec, const std::string& name) noexcept;

[[nodiscard]] std::size_t indicator_count(const CfaModelSpec& spec, const std::string& factor);

[[nodiscard]] std::size_t loading_count(const CfaModelSpec& spec) noexcept;

// Population correlation between two factors (1 for a factor with itself, 0 if unstated).
[[nodiscard]] double factor_correlation(const CfaModelSpec& spec, const std::string& a, const std::string& b);

[[nodiscard]] bool has_residual_correlation(const CfaModelSpec& spec, const std::string& item) noexcept;

// Free parameters of the fitted model: loadings, residual variances, all
// factor covariances and the stated residual covariances. Factor variances
// are fixed to 1.
[[nodiscard]] std::size_t free_parameter_count(const CfaModelSpec& spec);

[[nodiscard]] long degrees_of_freedom(const CfaModelSpec& spec);

// Largest |loading| or |correlation| in the model; 0 for an empty model.
[[nodiscard]] double max_abs_parameter(const CfaModelSpec& spec) noexcept;

// Estimation structure of the model. Parameter ids are lambda_<factor>_<item>,
// psi_<factor>_<factor>, theta_<item> and theta_<item>_<item>; start values are
// the standardized population values. Observed variables follow item_order.
[[nodiscard]] ModelIR build_model_ir(const CfaModelSpec& spec, const std::vector<std::string>& item_order);

[[nodiscard]] ModelIR build_model_ir(const CfaModelSpec& spec);

}  // namespace libdynfit
