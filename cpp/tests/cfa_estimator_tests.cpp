#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <Eigen/Core>

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

#include "libdynfit/cfa_estimator.hpp"
#include "libdynfit/cfa_model.hpp"
#include "libdynfit/cfa_objective.hpp"
#include "libdynfit/discrepancy.hpp"
#include "libdynfit/errors.hpp"
#include "libdynfit/misspecification.hpp"
#include "libdynfit/model_syntax.hpp"
#include "libdynfit/mvn_sampler.hpp"
#include "libdynfit/population_covariance.hpp"

namespace {
libdynfit::CfaModelSpec three_factor_model() {
    return libdynfit::parse_model_syntax("F1 =~ .7*x1 + .7*x2 + .75*x3\n"
                                         "F2 =~ .7*x4 + .7*x5 + .75*x6\n"
                                         "F3 =~ .7*x7 + .7*x8 + .75*x9\n"
                                         "F1 ~~ .3*F2\nF1 ~~ .3*F3\nF2 ~~ .3*F3",
                                         true);
}

libdynfit::FitResult fit_population(libdynfit::EstimationMethod method) {
    const auto spec = three_factor_model();
    const auto moments = libdynfit::moments_from_covariance(libdynfit::implied_covariance(spec), 500);
    auto ir = libdynfit::build_model_ir(spec);
    libdynfit::apply_moment_start_values(ir, moments);

    libdynfit::EstimatorOptions options;
    options.method = method;
    return libdynfit::CfaEstimator(options).fit(ir, moments);
}

double estimate(const libdynfit::FitResult& fit, const std::string& name) {
    for (std::size_t i = 0; i < fit.parameter_names.size(); ++i) {
        if (fit.parameter_names[i] == name) {
            return fit.parameter_estimates[i];
        }
    }
    return std::nan("");
}

void check_gradient(const libdynfit::CfaObjective& objective) {
    auto x = objective.initial_parameters();
    for (std::size_t i = 0; i < x.size(); ++i) {
        x[i] += 0.03 * static_cast<double>((i % 5) + 1) * ((i % 2 == 0) ? 1.0 : -1.0);
    }
    std::vector<double> analytic;
    const double f = objective.value_and_gradient(x, analytic);
    REQUIRE(std::isfinite(f));
    REQUIRE(f == Catch::Approx(objective.value(x)));

    const double h = 1e-6;
    for (std::size_t i = 0; i < x.size(); ++i) {
        auto up = x;
        auto down = x;
        up[i] += h;
        down[i] -= h;
        const double numeric = (objective.value(up) - objective.value(down)) / (2.0 * h);
        INFO("parameter " << objective.parameter_names()[i]);
        REQUIRE(analytic[i] == Catch::Approx(numeric).epsilon(1e-4).margin(1e-6));
    }
}
}  // namespace

TEST_CASE("CfaEstimator recovers a correctly specified population model", "[cfa_estimator]") {
    const auto fit = fit_population(libdynfit::EstimationMethod::ML);
    REQUIRE(fit.converged);
    REQUIRE(fit.free_parameters == 21);
    REQUIRE(fit.df == 24.0);
    REQUIRE(fit.baseline_df == 36.0);
    REQUIRE(fit.chi_square == Catch::Approx(0.0).margin(1e-3));
    REQUIRE(fit.p_value == Catch::Approx(1.0).margin(1e-6));
    REQUIRE(fit.cfi == Catch::Approx(1.0));
    REQUIRE(fit.tli == Catch::Approx(1.0).margin(1e-3));
    REQUIRE(fit.rmsea == Catch::Approx(0.0).margin(1e-4));
    REQUIRE(fit.srmr == Catch::Approx(0.0).margin(1e-3));

    REQUIRE(estimate(fit, "lambda_F1_x1") == Catch::Approx(0.7).margin(5e-3));
    REQUIRE(estimate(fit, "lambda_F3_x9") == Catch::Approx(0.75).margin(5e-3));
    REQUIRE(estimate(fit, "psi_F1_F2") == Catch::Approx(0.3).margin(5e-3));
    REQUIRE(estimate(fit, "theta_x3") == Catch::Approx(1.0 - 0.5625).margin(5e-3));

    const double q = static_cast<double>(fit.free_parameters);
    REQUIRE(fit.aic == Catch::Approx(-2.0 * fit.log_likelihood + 2.0 * q));
    REQUIRE(fit.bic == Catch::Approx(-2.0 * fit.log_likelihood + q * std::log(500.0)));
}

TEST_CASE("CfaEstimator least squares estimators recover the population model", "[cfa_estimator]") {
    for (const auto method : {libdynfit::EstimationMethod::GLS, libdynfit::EstimationMethod::ULS}) {
        const auto fit = fit_population(method);
        INFO(libdynfit::to_string(method));
        REQUIRE(fit.converged);
        REQUIRE(fit.method == method);
        REQUIRE(fit.chi_square == Catch::Approx(0.0).margin(1e-3));
        REQUIRE(fit.cfi == Catch::Approx(1.0));
        REQUIRE(estimate(fit, "lambda_F2_x5") == Catch::Approx(0.7).margin(5e-3));
        REQUIRE(std::isnan(fit.log_likelihood));
    }
}

TEST_CASE("CfaEstimator detects an omitted cross-loading", "[cfa_estimator]") {
    const auto spec = three_factor_model();
    const auto levels = libdynfit::build_misspecification_levels(spec);
    const auto moments = libdynfit::moments_from_covariance(libdynfit::implied_covariance(levels[2].spec,
                                                                                          libdynfit::observed_items(spec)),
                                                            500);
    const auto fit = libdynfit::CfaEstimator().fit(libdynfit::build_model_ir(spec), moments);
    REQUIRE(fit.converged);
    REQUIRE(fit.chi_square > 10.0);
    REQUIRE(fit.p_value < 0.05);
    REQUIRE(fit.rmsea > 0.0);
    REQUIRE(fit.cfi < 1.0);
    REQUIRE(fit.srmr > 0.0);
}

TEST_CASE("CfaEstimator fits raw data with the weighted least squares estimators", "[cfa_estimator]") {
    const auto spec = three_factor_model();
    const Eigen::MatrixXd data = libdynfit::sample_multivariate_normal(libdynfit::implied_covariance(spec), 2000, 11);

    for (const auto method : {libdynfit::EstimationMethod::DWLS, libdynfit::EstimationMethod::WLS}) {
        libdynfit::EstimatorOptions options;
        options.method = method;
        const auto fit = libdynfit::CfaEstimator(options).fit(libdynfit::build_model_ir(spec), data);
        INFO(libdynfit::to_string(method));
        REQUIRE(fit.converged);
        REQUIRE(std::isfinite(fit.chi_square));
        REQUIRE(fit.sample_size == 2000);
        REQUIRE(estimate(fit, "lambda_F1_x3") == Catch::Approx(0.75).margin(0.1));
    }
}

TEST_CASE("CfaEstimator reports a singular sample covariance as non-convergence", "[cfa_estimator]") {
    const auto spec = libdynfit::parse_model_syntax("F1 =~ .7*x1 + .7*x2 + .7*x3\nF2 =~ .7*x4 + .7*x5 + .7*x6", true);
    const auto moments = libdynfit::moments_from_covariance(Eigen::MatrixXd::Ones(6, 6), 200);
    const auto fit = libdynfit::CfaEstimator().fit(libdynfit::build_model_ir(spec), moments);
    REQUIRE_FALSE(fit.converged);
    REQUIRE(std::isnan(fit.cfi));
    REQUIRE(std::isnan(fit.srmr));
    REQUIRE(fit.parameter_names.size() == 13);
}

TEST_CASE("CfaObjective gradient matches finite differences", "[cfa_estimator]") {
    const auto spec = libdynfit::parse_model_syntax("F1 =~ .7*x1 + .6*x2 + .7*x3\n"
                                                    "F2 =~ .7*x4 + .8*x5 + .6*x6\n"
                                                    "F1 ~~ .4*F2\nx1 ~~ .2*x4",
                                                    true);
    const auto levels = libdynfit::build_misspecification_levels(spec);
    const Eigen::MatrixXd data =
        libdynfit::sample_multivariate_normal(libdynfit::implied_covariance(levels[1].spec, libdynfit::observed_items(spec)),
                                              800, 3);
    const auto moments = libdynfit::compute_sample_moments(data, true);
    const auto ir = libdynfit::build_model_ir(spec);

    for (const auto method : {libdynfit::EstimationMethod::ML, libdynfit::EstimationMethod::GLS,
                              libdynfit::EstimationMethod::ULS, libdynfit::EstimationMethod::DWLS,
                              libdynfit::EstimationMethod::WLS}) {
        INFO(libdynfit::to_string(method));
        const auto discrepancy = libdynfit::make_discrepancy(method, moments);
        const libdynfit::CfaObjective objective(ir, *discrepancy);
        REQUIRE(objective.parameter_names().size() == 14);
        check_gradient(objective);
    }
}

TEST_CASE("Discrepancy baselines fit the independence model", "[cfa_estimator]") {
    Eigen::MatrixXd sample(3, 3);
    sample << 1.0, 0.4, 0.3,
              0.4, 2.0, 0.5,
              0.3, 0.5, 1.5;
    const auto moments = libdynfit::moments_from_covariance(sample, 100);

    const auto ml = libdynfit::make_discrepancy(libdynfit::EstimationMethod::ML, moments);
    const double log_det_diag = std::log(1.0) + std::log(2.0) + std::log(1.5);
    REQUIRE(ml->baseline_value() == Catch::Approx(log_det_diag - std::log(sample.determinant())));

    const auto uls = libdynfit::make_discrepancy(libdynfit::EstimationMethod::ULS, moments);
    REQUIRE(uls->baseline_value() == Catch::Approx(0.4 * 0.4 + 0.3 * 0.3 + 0.5 * 0.5));

    // GLS independence variances minimize the GLS function over diagonal matrices.
    const auto gls = libdynfit::make_discrepancy(libdynfit::EstimationMethod::GLS, moments);
    const Eigen::VectorXd psi = gls->independence_variances();
    const double best = gls->baseline_value();
    for (Eigen::Index i = 0; i < 3; ++i) {
        Eigen::VectorXd shifted = psi;
        shifted(i) += 0.01;
        REQUIRE(gls->value(shifted.asDiagonal().toDenseMatrix()) > best);
    }

    REQUIRE_THROWS_AS(libdynfit::make_discrepancy(libdynfit::EstimationMethod::WLS, moments), std::invalid_argument);
}

TEST_CASE("parse_estimation_method accepts the supported estimators", "[cfa_estimator]") {
    REQUIRE(libdynfit::parse_estimation_method("ml") == libdynfit::EstimationMethod::ML);
    REQUIRE(libdynfit::parse_estimation_method("Uls") == libdynfit::EstimationMethod::ULS);
    REQUIRE(libdynfit::parse_estimation_method("DWLS") == libdynfit::EstimationMethod::DWLS);
    REQUIRE(libdynfit::parse_estimation_method("ulsmv") == libdynfit::EstimationMethod::ULS);
    REQUIRE(libdynfit::parse_estimation_method("WLSMV") == libdynfit::EstimationMethod::DWLS);
    REQUIRE(libdynfit::parse_estimation_method("WLSM") == libdynfit::EstimationMethod::DWLS);
    REQUIRE(libdynfit::requires_fourth_order(libdynfit::EstimationMethod::WLS));
    REQUIRE_FALSE(libdynfit::requires_fourth_order(libdynfit::EstimationMethod::GLS));
    REQUIRE_THROWS_AS(libdynfit::parse_estimation_method("MLR"), libdynfit::UnsupportedEstimatorError);
    REQUIRE_THROWS_AS(libdynfit::parse_estimation_method("bayes"), libdynfit::UnsupportedEstimatorError);
}

TEST_CASE("CfaEstimator selects its optimizer by name", "[cfa_estimator]") {
    const auto spec = three_factor_model();
    const auto moments = libdynfit::moments_from_covariance(libdynfit::implied_covariance(spec), 500);

    libdynfit::EstimatorOptions options;
    options.optimizer_name = "gd";
    // Population start values sit at the minimum, so descent stops at once.
    const auto fit = libdynfit::CfaEstimator(options).fit(libdynfit::build_model_ir(spec), moments);
    REQUIRE(fit.converged);
    REQUIRE(fit.chi_square == Catch::Approx(0.0).margin(1e-6));
    REQUIRE(estimate(fit, "lambda_F1_x3") == Catch::Approx(0.75).margin(1e-6));

    options.optimizer_name = "newton";
    REQUIRE_THROWS_AS(libdynfit::CfaEstimator(options), std::invalid_argument);
}

TEST_CASE("chi_square_upper_tail matches reference values", "[cfa_estimator]") {
    REQUIRE(libdynfit::chi_square_upper_tail(3.841458820694124, 1.0) == Catch::Approx(0.05).margin(1e-6));
    REQUIRE(libdynfit::chi_square_upper_tail(18.307038053275146, 10.0) == Catch::Approx(0.05).margin(1e-6));
    REQUIRE(libdynfit::chi_square_upper_tail(0.0, 5.0) == 1.0);
    REQUIRE(std::isnan(libdynfit::chi_square_upper_tail(1.0, 0.0)));
}
