#include "libdynfit/cfa_objective.hpp"

#include "libdynfit/parameter_transform.hpp"

#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <unordered_map>

namespace libdynfit {

namespace {
[[nodiscard]] std::unordered_map<std::string, Eigen::Index> index_names(const std::vector<std::string>& names) {
    std::unordered_map<std::string, Eigen::Index> index;
    for (std::size_t i = 0; i < names.size(); ++i) {
        index.emplace(names[i], static_cast<Eigen::Index>(i));
    }
    return index;
}

[[nodiscard]] double parse_fixed_value(const std::string& literal) {
    char* end = nullptr;
    const double value = std::strtod(literal.c_str(), &end);
    if (end == literal.c_str() || *end != '\0') {
        throw std::invalid_argument("edge references unknown parameter: " + literal);
    }
    return value;
}
}  // namespace

Eigen::MatrixXd CfaMatrices::implied_covariance() const {
    return lambda * phi * lambda.transpose() + theta;
}

CfaParameterization::CfaParameterization(const ModelIR& model)
    : observed_(observed_variable_names(model)), latent_(latent_variable_names(model)) {
    if (observed_.empty()) {
        throw std::invalid_argument("CFA model needs observed variables");
    }

    std::unordered_map<std::string, const ParameterSpec*> specs;
    for (const auto& param : model.parameters) {
        specs.emplace(param.id, &param);
        if (param.constraint != ParameterConstraint::Fixed) {
            catalog_.register_parameter(param.id, param.initial_value, make_transform(param.constraint));
        }
    }

    const auto observed_index = index_names(observed_);
    const auto latent_index = index_names(latent_);
    for (const auto& edge : model.edges) {
        Slot slot{Block::Theta, 0, 0, ParameterCatalog::npos, 0.0};
        if (edge.kind == EdgeKind::Loading) {
            slot.block = Block::Lambda;
            slot.row = observed_index.at(edge.target);
            slot.col = latent_index.at(edge.source);
        } else if (latent_index.contains(edge.source)) {
            slot.block = Block::Phi;
            slot.row = latent_index.at(edge.source);
            slot.col = latent_index.at(edge.target);
        } else {
            slot.row = observed_index.at(edge.source);
            slot.col = observed_index.at(edge.target);
        }

        const std::size_t index = catalog_.find_index(edge.parameter_id);
        if (index != ParameterCatalog::npos) {
            slot.parameter = index;
        } else if (auto it = specs.find(edge.parameter_id); it != specs.end()) {
            slot.fixed_value = it->second->initial_value;
        } else {
            slot.fixed_value = parse_fixed_value(edge.parameter_id);
        }
        slots_.push_back(slot);
    }
}

const ParameterCatalog& CfaParameterization::catalog() const noexcept {
    return catalog_;
}

const std::vector<std::string>& CfaParameterization::observed_names() const noexcept {
    return observed_;
}

const std::vector<std::string>& CfaParameterization::latent_names() const noexcept {
    return latent_;
}

CfaMatrices CfaParameterization::assemble(const std::vector<double>& constrained) const {
    if (constrained.size() != catalog_.size()) {
        throw std::invalid_argument("parameter vector size mismatch");
    }
    const auto p = static_cast<Eigen::Index>(observed_.size());
    const auto f = static_cast<Eigen::Index>(latent_.size());
    CfaMatrices matrices{Eigen::MatrixXd::Zero(p, f), Eigen::MatrixXd::Identity(f, f), Eigen::MatrixXd::Zero(p, p)};
    for (const auto& slot : slots_) {
        const double value = slot.parameter == ParameterCatalog::npos ? slot.fixed_value : constrained[slot.parameter];
        switch (slot.block) {
            case Block::Lambda:
                matrices.lambda(slot.row, slot.col) = value;
                break;
            case Block::Phi:
                matrices.phi(slot.row, slot.col) = value;
                matrices.phi(slot.col, slot.row) = value;
                break;
            case Block::Theta:
                matrices.theta(slot.row, slot.col) = value;
                matrices.theta(slot.col, slot.row) = value;
                break;
        }
    }
    return matrices;
}

std::vector<double> CfaParameterization::parameter_gradient(const CfaMatrices& matrices,
                                                            const Eigen::MatrixXd& derivative) const {
    const Eigen::MatrixXd d_lambda = 2.0 * derivative * matrices.lambda * matrices.phi;
    const Eigen::MatrixXd d_phi = matrices.lambda.transpose() * derivative * matrices.lambda;

    std::vector<double> grad(catalog_.size(), 0.0);
    for (const auto& slot : slots_) {
        if (slot.parameter == ParameterCatalog::npos) {
            continue;
        }
        const bool diagonal = slot.row == slot.col;
        switch (slot.block) {
            case Block::Lambda:
                grad[slot.parameter] += d_lambda(slot.row, slot.col);
                break;
            case Block::Phi:
                grad[slot.parameter] += (diagonal ? 1.0 : 2.0) * d_phi(slot.row, slot.col);
                break;
            case Block::Theta:
                grad[slot.parameter] += (diagonal ? 1.0 : 2.0) * derivative(slot.row, slot.col);
                break;
        }
    }
    return grad;
}

CfaObjective::CfaObjective(const ModelIR& model, const DiscrepancyFunction& discrepancy)
    : parameterization_(model), discrepancy_(discrepancy) {}

double CfaObjective::value(const std::vector<double>& parameters) const {
    const auto matrices = parameterization_.assemble(to_constrained(parameters));
    return discrepancy_.value(matrices.implied_covariance());
}

std::vector<double> CfaObjective::gradient(const std::vector<double>& parameters) const {
    std::vector<double> grad;
    (void)value_and_gradient(parameters, grad);
    return grad;
}

double CfaObjective::value_and_gradient(const std::vector<double>& parameters, std::vector<double>& gradient) const {
    const auto& catalog = parameterization_.catalog();
    const auto matrices = parameterization_.assemble(catalog.constrain(parameters));
    Eigen::MatrixXd derivative;
    const double fx = discrepancy_.value_and_derivative(matrices.implied_covariance(), derivative);
    if (!std::isfinite(fx)) {
        gradient.assign(parameters.size(), 0.0);
        return fx;
    }
    gradient = parameterization_.parameter_gradient(matrices, derivative);
    const auto jacobian = catalog.constrained_derivatives(parameters);
    for (std::size_t i = 0; i < gradient.size(); ++i) {
        gradient[i] *= jacobian[i];
    }
    return fx;
}

const CfaParameterization& CfaObjective::parameterization() const noexcept {
    return parameterization_;
}

const std::vector<std::string>& CfaObjective::parameter_names() const noexcept {
    return parameterization_.catalog().names();
}

std::vector<double> CfaObjective::initial_parameters() const {
    return parameterization_.catalog().initial_unconstrained();
}

std::vector<double> CfaObjective::to_constrained(const std::vector<double>& unconstrained) const {
    return parameterization_.catalog().constrain(unconstrained);
}

}  // namespace libdynfit
