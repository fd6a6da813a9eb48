#pragma once

#include "libdynfit/cfa_model.hpp"

#include <Eigen/Core>

#include <string>
#include <vector>

namespace libdynfit {

// Population covariance Lambda Phi Lambda' + Theta of a standardized model:
// unit factor variances, Theta_ii = 1 - communality_i and
// Theta_ij = r_ij * sqrt(Theta_ii * Theta_jj). Rows follow item_order.
// Throws InvalidPopulationModelError when a communality reaches 1 or the
// result is not positive definite.
[[nodiscard]] Eigen::MatrixXd implied_covariance(const CfaModelSpec& spec,
                                                 const std::vector<std::string>& item_order);

[[nodiscard]] Eigen::MatrixXd implied_covariance(const CfaModelSpec& spec);

}  // namespace libdynfit
