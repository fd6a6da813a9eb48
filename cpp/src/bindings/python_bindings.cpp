#include <pybind11/eigen.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "libdynfit/cfa_estimator.hpp"
#include "libdynfit/cfa_model.hpp"
#include "libdynfit/dynamic_fit.hpp"
#include "libdynfit/errors.hpp"
#include "libdynfit/misspecification.hpp"
#include "libdynfit/model_syntax.hpp"
#include "libdynfit/model_validator.hpp"
#include "libdynfit/population_covariance.hpp"

namespace py = pybind11;
using namespace libdynfit;

PYBIND11_MODULE(_libdynfit, m) {
    m.doc() = "libdynfit python bindings";

    auto base_error = py::register_exception<DynamicFitError>(m, "DynamicFitError", PyExc_RuntimeError);
    py::register_exception<InputMismatchError>(m, "InputMismatchError", base_error.ptr());
    py::register_exception<ModelSyntaxError>(m, "ModelSyntaxError", base_error.ptr());
    py::register_exception<InvalidParameterError>(m, "InvalidParameterError", base_error.ptr());
    py::register_exception<UnsupportedModelError>(m, "UnsupportedModelError", base_error.ptr());
    py::register_exception<IdentificationError>(m, "IdentificationError", base_error.ptr());
    py::register_exception<InsufficientCandidatesError>(m, "InsufficientCandidatesError", base_error.ptr());
    py::register_exception<UnsupportedEstimatorError>(m, "UnsupportedEstimatorError", base_error.ptr());
    py::register_exception<InvalidPopulationModelError>(m, "InvalidPopulationModelError", base_error.ptr());
    py::register_exception<SimulationReliabilityError>(m, "SimulationReliabilityError", base_error.ptr());

    py::enum_<EstimationMethod>(m, "EstimationMethod")
        .value("ML", EstimationMethod::ML)
        .value("GLS", EstimationMethod::GLS)
        .value("ULS", EstimationMethod::ULS)
        .value("DWLS", EstimationMethod::DWLS)
        .value("WLS", EstimationMethod::WLS)
        .export_values();

    py::enum_<FitIndex>(m, "FitIndex")
        .value("SRMR", FitIndex::SRMR)
        .value("RMSEA", FitIndex::RMSEA)
        .value("CFI", FitIndex::CFI)
        .export_values();

    py::class_<IndicatorSpec>(m, "IndicatorSpec")
        .def(py::init<>())
        .def_readwrite("item", &IndicatorSpec::item)
        .def_readwrite("loading", &IndicatorSpec::loading);

    py::class_<FactorSpec>(m, "FactorSpec")
        .def(py::init<>())
        .def_readwrite("name", &FactorSpec::name)
        .def_readwrite("indicators", &FactorSpec::indicators);

    py::class_<CorrelationSpec>(m, "CorrelationSpec")
        .def(py::init<>())
        .def_readwrite("left", &CorrelationSpec::left)
        .def_readwrite("right", &CorrelationSpec::right)
        .def_readwrite("value", &CorrelationSpec::value);

    py::class_<CfaModelSpec>(m, "CfaModelSpec")
        .def(py::init<>())
        .def_readwrite("factors", &CfaModelSpec::factors)
        .def_readwrite("factor_correlations", &CfaModelSpec::factor_correlations)
        .def_readwrite("residual_correlations", &CfaModelSpec::residual_correlations)
        .def("__str__", &format_model_syntax);

    py::class_<MisspecificationCandidate>(m, "MisspecificationCandidate")
        .def_readonly("item", &MisspecificationCandidate::item)
        .def_readonly("source_factor", &MisspecificationCandidate::source_factor)
        .def_readonly("target_factor", &MisspecificationCandidate::target_factor)
        .def_readonly("magnitude", &MisspecificationCandidate::magnitude);

    py::class_<MisspecifiedModel>(m, "MisspecifiedModel")
        .def_readonly("level", &MisspecifiedModel::level)
        .def_readonly("spec", &MisspecifiedModel::spec)
        .def_readonly("added", &MisspecifiedModel::added);

    py::class_<OptimizationOptions>(m, "OptimizationOptions")
        .def(py::init<>())
        .def_readwrite("max_iterations", &OptimizationOptions::max_iterations)
        .def_readwrite("tolerance", &OptimizationOptions::tolerance)
        .def_readwrite("learning_rate", &OptimizationOptions::learning_rate)
        .def_readwrite("m", &OptimizationOptions::m)
        .def_readwrite("max_linesearch", &OptimizationOptions::max_linesearch);

    py::class_<FitResult>(m, "FitResult")
        .def_readonly("converged", &FitResult::converged)
        .def_readonly("parameter_names", &FitResult::parameter_names)
        .def_readonly("parameter_estimates", &FitResult::parameter_estimates)
        .def_readonly("implied_covariance", &FitResult::implied_covariance)
        .def_readonly("chi_square", &FitResult::chi_square)
        .def_readonly("df", &FitResult::df)
        .def_readonly("p_value", &FitResult::p_value)
        .def_readonly("cfi", &FitResult::cfi)
        .def_readonly("tli", &FitResult::tli)
        .def_readonly("rmsea", &FitResult::rmsea)
        .def_readonly("srmr", &FitResult::srmr)
        .def_readonly("log_likelihood", &FitResult::log_likelihood)
        .def_readonly("aic", &FitResult::aic)
        .def_readonly("bic", &FitResult::bic);

    py::class_<IndexCutoff>(m, "IndexCutoff")
        .def_readonly("cutoff", &IndexCutoff::cutoff)
        .def_readonly("power", &IndexCutoff::power)
        .def("none", &IndexCutoff::none);

    py::class_<CutoffRow>(m, "CutoffRow")
        .def_readonly("level", &CutoffRow::level)
        .def_readonly("srmr", &CutoffRow::srmr)
        .def_readonly("rmsea", &CutoffRow::rmsea)
        .def_readonly("cfi", &CutoffRow::cfi)
        .def_readonly("magnitude", &CutoffRow::magnitude);

    py::class_<CfaHbOptions>(m, "CfaHbOptions")
        .def(py::init<>())
        .def_readwrite("manual", &CfaHbOptions::manual)
        .def_readwrite("sample_size", &CfaHbOptions::sample_size)
        .def_readwrite("estimator", &CfaHbOptions::estimator)
        .def_readwrite("replications", &CfaHbOptions::replications)
        .def_readwrite("plot", &CfaHbOptions::plot)
        .def_readwrite("seed", &CfaHbOptions::seed)
        .def_readwrite("threads", &CfaHbOptions::threads)
        .def_readwrite("max_failure_fraction", &CfaHbOptions::max_failure_fraction)
        .def_readwrite("optimization", &CfaHbOptions::optimization);

    m.def("parse_model_syntax", &parse_model_syntax, py::arg("text"), py::arg("require_values") = true);
    m.def("format_model_syntax", &format_model_syntax, py::arg("spec"));
    m.def("validate_model", &validate_model, py::arg("spec"));
    m.def("degrees_of_freedom", &degrees_of_freedom, py::arg("spec"));
    m.def("enumerate_candidates", &enumerate_candidates, py::arg("spec"));
    m.def("build_misspecification_levels", &build_misspecification_levels, py::arg("spec"));
    m.def("implied_covariance",
          py::overload_cast<const CfaModelSpec&>(&implied_covariance), py::arg("spec"));

    m.def("fit_cfa",
          [](const CfaModelSpec& spec, const Eigen::MatrixXd& data, const std::string& estimator) {
              EstimatorOptions options;
              options.method = parse_estimation_method(estimator);
              ModelIR model = build_model_ir(spec);
              const SampleMoments moments = compute_sample_moments(data, requires_fourth_order(options.method));
              apply_moment_start_values(model, moments);
              return CfaEstimator(options).fit(model, moments);
          },
          py::arg("spec"), py::arg("data"), py::arg("estimator") = "ML",
          "Fits the structure of spec to an n x p data matrix (columns in item order).");

    m.def("cfa_hb",
          [](const std::string& syntax, const CfaHbOptions& options) {
              CfaHbOptions manual = options;
              manual.manual = true;
              const CfaHbResult result = cfa_hb(ManualModel{syntax}, manual);
              py::dict out;
              out["cutoffs"] = result.cutoffs.render();
              out["rows"] = result.rows;
              out["seed"] = result.seed;
              out["warnings"] = result.warnings;
              return out;
          },
          py::arg("syntax"), py::arg("options"),
          "Dynamic fit index cutoffs for standardized model syntax (options.sample_size required).");
}
