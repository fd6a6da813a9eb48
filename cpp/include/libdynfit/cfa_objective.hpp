#pragma once

#include "libdynfit/discrepancy.hpp"
#include "libdynfit/model_types.hpp"
#include "libdynfit/optimizer.hpp"
#include "libdynfit/parameter_catalog.hpp"

#include <Eigen/Core>

#include <cstddef>
#include <string>
#include <vector>

namespace libdynfit {

struct CfaMatrices {
    Eigen::MatrixXd lambda;  // p x f loadings
    Eigen::MatrixXd phi;     // f x f factor covariances
    Eigen::MatrixXd theta;   // p x p residual covariances

    [[nodiscard]] Eigen::MatrixXd implied_covariance() const;
};

// Maps the free parameters of a CFA ModelIR onto Lambda, Phi and Theta.
// Rows follow the model's observed variables, columns its latent variables.
// Factor variances without an edge are fixed to 1.
class CfaParameterization {
public:
    explicit CfaParameterization(const ModelIR& model);

    [[nodiscard]] const ParameterCatalog& catalog() const noexcept;

    [[nodiscard]] const std::vector<std::string>& observed_names() const noexcept;

    [[nodiscard]] const std::vector<std::string>& latent_names() const noexcept;

    [[nodiscard]] CfaMatrices assemble(const std::vector<double>& constrained) const;

    // Chain rule from dF/dSigma to dF/d(constrained parameter).
    [[nodiscard]] std::vector<double> parameter_gradient(const CfaMatrices& matrices,
                                                         const Eigen::MatrixXd& derivative) const;

private:
    enum class Block {
        Lambda,
        Phi,
        Theta
    };

    struct Slot {
        Block block;
        Eigen::Index row;
        Eigen::Index col;
        std::size_t parameter;  // ParameterCatalog::npos for fixed slots
        double fixed_value;
    };

    ParameterCatalog catalog_;
    std::vector<std::string> observed_;
    std::vector<std::string> latent_;
    std::vector<Slot> slots_;
};

// Discrepancy of the model-implied covariance as a function of the
// unconstrained optimizer coordinates.
class CfaObjective final : public ObjectiveFunction {
public:
    CfaObjective(const ModelIR& model, const DiscrepancyFunction& discrepancy);

    [[nodiscard]] double value(const std::vector<double>& parameters) const override;

    [[nodiscard]] std::vector<double> gradient(const std::vector<double>& parameters) const override;

    [[nodiscard]] double value_and_gradient(const std::vector<double>& parameters,
                                            std::vector<double>& gradient) const override;

    [[nodiscard]] const CfaParameterization& parameterization() const noexcept;

    [[nodiscard]] const std::vector<std::string>& parameter_names() const noexcept;

    [[nodiscard]] std::vector<double> initial_parameters() const;

    [[nodiscard]] std::vector<double> to_constrained(const std::vector<double>& unconstrained) const;

private:
    CfaParameterization parameterization_;
    const DiscrepancyFunction& discrepancy_;
};

}  // namespace libdynfit
