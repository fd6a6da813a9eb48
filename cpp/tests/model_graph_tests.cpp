#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

#include "libdynfit/model_graph.hpp"
#include "libdynfit/model_ir.hpp"

TEST_CASE("ModelGraph registers loadings and residual variances", "[model_graph]") {
    libdynfit::ModelGraph graph;
    graph.add_variable("F1", libdynfit::VariableKind::Latent);
    graph.add_variable("x1", libdynfit::VariableKind::Observed);
    graph.add_variable("x2", libdynfit::VariableKind::Observed);

    graph.add_edge(libdynfit::EdgeKind::Loading, "F1", "x1", "lambda_F1_x1");
    graph.add_edge(libdynfit::EdgeKind::Loading, "F1", "x2", "lambda_F1_x2");
    graph.add_edge(libdynfit::EdgeKind::Covariance, "x1", "x1", "theta_x1");
    graph.add_edge(libdynfit::EdgeKind::Covariance, "F1", "F1", "1.0");

    const auto ir = graph.to_model_ir();
    REQUIRE(ir.variables.size() == 3);
    REQUIRE(ir.edges.size() == 4);
    // The fixed factor variance is a literal, not a parameter.
    REQUIRE(ir.parameters.size() == 3);

    REQUIRE(ir.parameters[0].id == "lambda_F1_x1");
    REQUIRE(ir.parameters[0].constraint == libdynfit::ParameterConstraint::Free);
    REQUIRE(ir.parameters[0].initial_value == 0.0);
    REQUIRE(ir.parameters[2].id == "theta_x1");
    REQUIRE(ir.parameters[2].constraint == libdynfit::ParameterConstraint::Positive);
    REQUIRE(ir.parameters[2].initial_value == 0.5);

    REQUIRE(libdynfit::observed_variable_names(ir) == std::vector<std::string>{"x1", "x2"});
    REQUIRE(libdynfit::latent_variable_names(ir) == std::vector<std::string>{"F1"});
}

TEST_CASE("ModelGraph rejects malformed edges", "[model_graph]") {
    libdynfit::ModelGraph graph;
    graph.add_variable("F1", libdynfit::VariableKind::Latent);
    graph.add_variable("x1", libdynfit::VariableKind::Observed);

    REQUIRE_THROWS_AS(graph.add_variable("x1", libdynfit::VariableKind::Observed), std::invalid_argument);
    REQUIRE_THROWS_AS(graph.add_edge(libdynfit::EdgeKind::Loading, "F1", "x9", "l"), std::invalid_argument);
    REQUIRE_THROWS_AS(graph.add_edge(libdynfit::EdgeKind::Loading, "x1", "F1", "l"), std::invalid_argument);
    REQUIRE_THROWS_AS(graph.add_edge(libdynfit::EdgeKind::Covariance, "F1", "x1", "c"), std::invalid_argument);
    REQUIRE_THROWS_AS(graph.add_edge(libdynfit::EdgeKind::Loading, "F1", "x1", ""), std::invalid_argument);
}

TEST_CASE("ModelGraph shares parameters between edges", "[model_graph]") {
    libdynfit::ModelGraph graph;
    graph.add_variable("F1", libdynfit::VariableKind::Latent);
    graph.add_variable("x1", libdynfit::VariableKind::Observed);
    graph.add_variable("x2", libdynfit::VariableKind::Observed);

    graph.add_edge(libdynfit::EdgeKind::Loading, "F1", "x1", "lambda");
    graph.add_edge(libdynfit::EdgeKind::Loading, "F1", "x2", "lambda");
    REQUIRE(graph.parameters().size() == 1);

    graph.add_edge(libdynfit::EdgeKind::Covariance, "x1", "x1", "theta");
    REQUIRE_THROWS_AS(graph.register_parameter("theta", libdynfit::ParameterConstraint::Free), std::invalid_argument);
}

TEST_CASE("ModelGraph validates initial values", "[model_graph]") {
    libdynfit::ModelGraph graph;
    graph.add_variable("x1", libdynfit::VariableKind::Observed);
    graph.add_edge(libdynfit::EdgeKind::Covariance, "x1", "x1", "theta_x1");

    graph.set_parameter_initial_value("theta_x1", 0.36);
    REQUIRE(graph.parameters().front().initial_value == 0.36);
    REQUIRE_THROWS_AS(graph.set_parameter_initial_value("theta_x1", 0.0), std::out_of_range);
    REQUIRE_THROWS_AS(graph.set_parameter_initial_value("missing", 1.0), std::invalid_argument);
}

TEST_CASE("ModelIRBuilder requires variables", "[model_graph]") {
    libdynfit::ModelIRBuilder builder;
    REQUIRE_THROWS_AS(builder.build(), std::invalid_argument);

    builder.add_variable("F1", libdynfit::VariableKind::Latent);
    builder.add_variable("x1", libdynfit::VariableKind::Observed);
    builder.add_edge(libdynfit::EdgeKind::Loading, "F1", "x1", "lambda_F1_x1");
    builder.set_parameter_initial_value("lambda_F1_x1", 0.7);

    const auto ir = builder.build();
    REQUIRE(ir.parameters.size() == 1);
    REQUIRE(ir.parameters.front().initial_value == 0.7);
}
