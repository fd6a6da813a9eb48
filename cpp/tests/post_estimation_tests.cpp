#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <Eigen/Core>

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

#include "libdynfit/cfa_model.hpp"
#include "libdynfit/model_syntax.hpp"
#include "libdynfit/population_covariance.hpp"
#include "libdynfit/post_estimation.hpp"

namespace {
struct NamedValues {
    std::vector<std::string> names;
    std::vector<double> values;
};

NamedValues start_values(const libdynfit::ModelIR& ir) {
    NamedValues out;
    for (const auto& param : ir.parameters) {
        out.names.push_back(param.id);
        out.values.push_back(param.initial_value);
    }
    return out;
}

const libdynfit::StandardizedEdgeResult& edge_result(const libdynfit::ModelIR& ir,
                                                     const libdynfit::StandardizedSolution& solution,
                                                     const std::string& parameter_id) {
    for (std::size_t i = 0; i < ir.edges.size(); ++i) {
        if (ir.edges[i].parameter_id == parameter_id) {
            return solution.edges[i];
        }
    }
    throw std::out_of_range("no edge with parameter " + parameter_id);
}
}  // namespace

TEST_CASE("Standardized estimates of a standardized model reproduce it", "[post_estimation]") {
    const auto spec = libdynfit::parse_model_syntax("F1 =~ .7*x1 + .6*x2 + .8*x3\n"
                                                    "F2 =~ .7*x4 + .7*x5 + .5*x6\n"
                                                    "F1 ~~ .4*F2\nx2 ~~ .25*x5",
                                                    true);
    const auto ir = libdynfit::build_model_ir(spec);
    const auto params = start_values(ir);
    const auto solution = libdynfit::compute_standardized_estimates(ir, params.names, params.values);
    REQUIRE(solution.edges.size() == ir.edges.size());

    REQUIRE(edge_result(ir, solution, "lambda_F1_x3").std_all == Catch::Approx(0.8));
    REQUIRE(edge_result(ir, solution, "lambda_F2_x6").std_all == Catch::Approx(0.5));
    REQUIRE(edge_result(ir, solution, "psi_F1_F2").std_all == Catch::Approx(0.4));
    REQUIRE(edge_result(ir, solution, "theta_x2").std_all == Catch::Approx(1.0 - 0.36));
    REQUIRE(edge_result(ir, solution, "theta_x2_x5").std_all == Catch::Approx(0.25));
    REQUIRE(edge_result(ir, solution, "1.0").std_all == Catch::Approx(1.0));
}

TEST_CASE("Standardized estimates rescale unstandardized loadings", "[post_estimation]") {
    const auto spec = libdynfit::parse_model_syntax("F1 =~ .7*x1 + .7*x2 + .7*x3\nF2 =~ .7*x4 + .7*x5 + .7*x6", true);
    const auto ir = libdynfit::build_model_ir(spec);
    auto params = start_values(ir);
    for (std::size_t i = 0; i < params.names.size(); ++i) {
        if (params.names[i] == "lambda_F1_x1") {
            params.values[i] = 2.0;
        } else if (params.names[i] == "theta_x1") {
            params.values[i] = 1.0;
        }
    }
    const auto solution = libdynfit::compute_standardized_estimates(ir, params.names, params.values);
    const auto& loading = edge_result(ir, solution, "lambda_F1_x1");
    REQUIRE(loading.estimate == Catch::Approx(2.0));
    REQUIRE(loading.std_lv == Catch::Approx(2.0));
    REQUIRE(loading.std_all == Catch::Approx(2.0 / std::sqrt(5.0)));

    params.values.pop_back();
    REQUIRE_THROWS_AS(libdynfit::compute_standardized_estimates(ir, params.names, params.values), std::invalid_argument);
}

TEST_CASE("Model diagnostics report residuals and SRMR", "[post_estimation]") {
    const auto spec = libdynfit::parse_model_syntax("F1 =~ .7*x1 + .7*x2 + .7*x3\nF2 =~ .7*x4 + .7*x5 + .7*x6\n"
                                                    "F1 ~~ .3*F2",
                                                    true);
    const auto ir = libdynfit::build_model_ir(spec);
    const auto params = start_values(ir);

    Eigen::MatrixXd sample = libdynfit::implied_covariance(spec);
    auto diag = libdynfit::compute_model_diagnostics(ir, params.names, params.values, sample);
    REQUIRE(diag.srmr == Catch::Approx(0.0).margin(1e-12));
    REQUIRE(diag.covariance_residuals.cwiseAbs().maxCoeff() == Catch::Approx(0.0).margin(1e-12));

    sample(0, 3) += 0.1;
    sample(3, 0) += 0.1;
    diag = libdynfit::compute_model_diagnostics(ir, params.names, params.values, sample);
    REQUIRE(diag.correlation_residuals(0, 3) == Catch::Approx(0.1));
    REQUIRE(diag.srmr == Catch::Approx(std::sqrt(0.01 / 21.0)));
}

TEST_CASE("standardized_rmr scales residuals by the sample standard deviations", "[post_estimation]") {
    Eigen::MatrixXd sample(2, 2);
    sample << 4.0, 0.0,
              0.0, 1.0;
    Eigen::MatrixXd implied(2, 2);
    implied << 4.0, 0.2,
               0.2, 1.0;
    // (0 - 0.2) / (2 * 1) = -0.1 over three distinct elements.
    REQUIRE(libdynfit::standardized_rmr(sample, implied) == Catch::Approx(std::sqrt(0.01 / 3.0)));
    REQUIRE_THROWS_AS(libdynfit::standardized_rmr(sample, Eigen::MatrixXd::Identity(3, 3)), std::invalid_argument);
}
