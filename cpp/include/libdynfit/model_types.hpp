#pragma once

#include <string>
#include <vector>

namespace libdynfit {

enum class VariableKind {
    Observed,
    Latent
};

enum class EdgeKind {
    Loading,
    Covariance
};

enum class ParameterConstraint {
    Free,
    Positive,
    Fixed
};

struct VariableSpec {
    std::string name;
    VariableKind kind;
};

// Loading edges point from a latent source to an observed target.
// Covariance edges are undirected; source == target denotes a variance.
// parameter_id is either a free parameter name or a numeric literal (fixed value).
struct EdgeSpec {
    EdgeKind kind;
    std::string source;
    std::string target;
    std::string parameter_id;
};

struct ParameterSpec {
    std::string id;
    ParameterConstraint constraint{ParameterConstraint::Free};
    double initial_value{0.0};
};

struct ModelIR {
    std::vector<VariableSpec> variables;
    std::vector<EdgeSpec> edges;
    std::vector<ParameterSpec> parameters;
};

[[nodiscard]] std::vector<std::string> observed_variable_names(const ModelIR& model);

[[nodiscard]] std::vector<std::string> latent_variable_names(const ModelIR& model);

}  // namespace libdynfit
