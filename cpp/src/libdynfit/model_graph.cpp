#include "libdynfit/model_graph.hpp"

#include <cstdlib>
#include <stdexcept>

namespace libdynfit {

namespace {
[[nodiscard]] bool is_numeric_literal(const std::string& value) {
    if (value.empty()) {
        return false;
    }
    char* end = nullptr;
    std::strtod(value.c_str(), &end);
    return end != nullptr && end != value.c_str() && *end == '\0';
}

constexpr double kDefaultCoefficientInit = 0.0;
constexpr double kDefaultVarianceInit = 0.5;
}  // namespace

std::vector<std::string> observed_variable_names(const ModelIR& model) {
    std::vector<std::string> names;
    for (const auto& var : model.variables) {
        if (var.kind == VariableKind::Observed) {
            names.push_back(var.name);
        }
    }
    return names;
}

std::vector<std::string> latent_variable_names(const ModelIR& model) {
    std::vector<std::string> names;
    for (const auto& var : model.variables) {
        if (var.kind == VariableKind::Latent) {
            names.push_back(var.name);
        }
    }
    return names;
}

void ModelGraph::add_variable(std::string name, VariableKind kind) {
    if (name.empty()) {
        throw std::invalid_argument("variable name must be non-empty");
    }
    if (variable_index_.contains(name)) {
        throw std::invalid_argument("duplicate variable name: " + name);
    }
    variable_index_.emplace(name, kind);
    variables_.push_back(VariableSpec{std::move(name), kind});
}

void ModelGraph::add_edge(EdgeKind kind, std::string source, std::string target, std::string parameter_id) {
    if (source.empty() || target.empty()) {
        throw std::invalid_argument("edge endpoints must be non-empty");
    }
    if (parameter_id.empty()) {
        throw std::invalid_argument("edge parameter id must be non-empty");
    }
    auto source_it = variable_index_.find(source);
    if (source_it == variable_index_.end()) {
        throw std::invalid_argument("edge source not registered: " + source);
    }
    auto target_it = variable_index_.find(target);
    if (target_it == variable_index_.end()) {
        throw std::invalid_argument("edge target not registered: " + target);
    }
    if (kind == EdgeKind::Loading) {
        if (source_it->second != VariableKind::Latent || target_it->second != VariableKind::Observed) {
            throw std::invalid_argument("loading must point from a latent to an observed variable: " + source + " -> " + target);
        }
    } else if (source_it->second != target_it->second) {
        throw std::invalid_argument("covariance between latent and observed variable is not supported: " + source + " ~~ " + target);
    }

    if (!is_numeric_literal(parameter_id)) {
        double init = kDefaultCoefficientInit;
        ParameterConstraint constraint = ParameterConstraint::Free;

        if (kind == EdgeKind::Covariance && source == target) {
            init = kDefaultVarianceInit;
            constraint = ParameterConstraint::Positive;
        }

        register_parameter(parameter_id, constraint, init);
    }
    edges_.push_back(EdgeSpec{kind, std::move(source), std::move(target), std::move(parameter_id)});
}

void ModelGraph::register_parameter(std::string id,
                                    ParameterConstraint constraint,
                                    double initial_value) {
    if (id.empty()) {
        throw std::invalid_argument("parameter id must be non-empty");
    }
    auto it = parameter_index_.find(id);
    if (it != parameter_index_.end()) {
        const auto& existing = parameters_[it->second];
        if (existing.constraint != constraint) {
            throw std::invalid_argument("parameter registered with conflicting constraint: " + id);
        }
        return;
    }
    ParameterSpec spec{std::move(id), constraint, initial_value};
    parameter_index_.emplace(spec.id, parameters_.size());
    parameters_.push_back(std::move(spec));
}

void ModelGraph::set_parameter_initial_value(const std::string& id, double initial_value) {
    auto it = parameter_index_.find(id);
    if (it == parameter_index_.end()) {
        throw std::invalid_argument("unknown parameter: " + id);
    }
    auto& spec = parameters_[it->second];
    if (spec.constraint == ParameterConstraint::Positive && !(initial_value > 0.0)) {
        throw std::out_of_range("initial value of positive parameter must be > 0: " + id);
    }
    spec.initial_value = initial_value;
}

const std::vector<VariableSpec>& ModelGraph::variables() const noexcept {
    return variables_;
}

const std::vector<EdgeSpec>& ModelGraph::edges() const noexcept {
    return edges_;
}

const std::vector<ParameterSpec>& ModelGraph::parameters() const noexcept {
    return parameters_;
}

ModelIR ModelGraph::to_model_ir() const {
    if (variables_.empty()) {
        throw std::invalid_argument("model graph must contain at least one variable");
    }
    ModelIR ir;
    ir.variables = variables_;
    ir.edges = edges_;
    ir.parameters = parameters_;
    return ir;
}

}  // namespace libdynfit
