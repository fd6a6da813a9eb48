#pragma once

#include "libdynfit/model_graph.hpp"
#include "libdynfit/model_types.hpp"

#include <string>

namespace libdynfit {

class ModelIRBuilder {
public:
    ModelIRBuilder() = default;

    void add_variable(std::string name, VariableKind kind);

    void add_edge(EdgeKind kind, std::string source, std::string target, std::string parameter_id);

    void set_parameter_initial_value(const std::string& id, double initial_value);

    [[nodiscard]] ModelIR build() const;

private:
    ModelGraph graph_;
};

}  // namespace libdynfit
