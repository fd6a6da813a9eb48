#include "libdynfit/model_ir.hpp"

namespace libdynfit {

void ModelIRBuilder::add_variable(std::string name, VariableKind kind) {
    graph_.add_variable(std::move(name), kind);
}

void ModelIRBuilder::add_edge(EdgeKind kind, std::string source, std::string target, std::string parameter_id) {
    graph_.add_edge(kind, std::move(source), std::move(target), std::move(parameter_id));
}

void ModelIRBuilder::set_parameter_initial_value(const std::string& id, double initial_value) {
    graph_.set_parameter_initial_value(id, initial_value);
}

ModelIR ModelIRBuilder::build() const {
    return graph_.to_model_ir();
}

}  // namespace libdynfit
