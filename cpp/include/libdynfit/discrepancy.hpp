#pragma once

#include "libdynfit/sample_moments.hpp"

#include <Eigen/Core>

#include <memory>
#include <string>

namespace libdynfit {

enum class EstimationMethod {
    ML,
    GLS,
    ULS,
    DWLS,
    WLS
};

// Case-insensitive. The robust names ULSM, ULSMV and ULSMVS map to ULS;
// WLSM, WLSMV and WLSMVS map to DWLS. Throws UnsupportedEstimatorError for
// MLR and unknown names.
[[nodiscard]] EstimationMethod parse_estimation_method(const std::string& name);

[[nodiscard]] std::string to_string(EstimationMethod method);

// DWLS and WLS weight the residuals with the ADF fourth-order moments.
[[nodiscard]] bool requires_fourth_order(EstimationMethod method) noexcept;

// Fit function F(Sigma) against fixed sample moments. The derivative D is
// taken with every entry of Sigma treated as free: dF = sum_ij D_ij dSigma_ij.
class DiscrepancyFunction {
public:
    virtual ~DiscrepancyFunction() = default;

    [[nodiscard]] virtual EstimationMethod method() const noexcept = 0;

    // +infinity where Sigma is outside the function's domain.
    [[nodiscard]] virtual double value(const Eigen::MatrixXd& sigma) const = 0;

    [[nodiscard]] virtual double value_and_derivative(const Eigen::MatrixXd& sigma, Eigen::MatrixXd& derivative) const = 0;

    // Variances minimizing F over diagonal Sigma (the independence model).
    [[nodiscard]] virtual Eigen::VectorXd independence_variances() const = 0;

    [[nodiscard]] double baseline_value() const;
};

// Throws std::domain_error when ML or GLS is requested for a singular sample
// covariance, and std::invalid_argument when DWLS/WLS lack fourth-order moments.
[[nodiscard]] std::unique_ptr<DiscrepancyFunction> make_discrepancy(EstimationMethod method,
                                                                    const SampleMoments& moments);

}  // namespace libdynfit
