#pragma once

#include "libdynfit/cfa_estimator.hpp"
#include "libdynfit/cfa_model.hpp"
#include "libdynfit/data_io.hpp"
#include "libdynfit/model_validator.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <variant>

namespace libdynfit {

// A structural CFA model estimated on raw data.
struct FittedModel {
    std::string syntax;
    CfaModelSpec structure;
    ModelIR model;
    FitResult fit;
};

// Standardized model text supplied by the user ("manual" input).
struct ManualModel {
    std::string syntax;
};

using ModelInput = std::variant<FittedModel, ManualModel>;

// Parses structural syntax (coefficients ignored), selects the model's items
// from data and fits it. Missing columns raise InputMismatchError.
[[nodiscard]] FittedModel fit_cfa(const std::string& syntax, const DataTable& data, const EstimatorOptions& options = {});

// Standardized (std.all) solution and case count of a fitted model. Throws
// InputMismatchError when the model did not converge.
[[nodiscard]] ResolvedModel extract_model(const FittedModel& fitted);

[[nodiscard]] std::string to_standardized_syntax(const FittedModel& fitted);

// Applies the manual flag and sample size rules and returns the standardized
// model the cutoffs are computed for. Validation is left to the caller.
[[nodiscard]] ResolvedModel resolve_model_input(const ModelInput& input,
                                                bool manual,
                                                std::optional<std::size_t> sample_size);

}  // namespace libdynfit
