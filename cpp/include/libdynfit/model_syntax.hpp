#pragma once

#include "libdynfit/cfa_model.hpp"

#include <string>

namespace libdynfit {

// Parses the lavaan-style CFA subset:
//   F1 =~ .7*x1 + .6*x2 + -.5*x3
//   F1 ~~ .3*F2          (factor correlation)
//   x1 ~~ .2*x4          (residual correlation)
// Statements are separated by newlines or ';' and '#' starts a comment.
// With require_values every term needs a numeric coefficient; otherwise
// coefficients and labels are accepted and ignored (structure only).
// Throws ModelSyntaxError for malformed text and UnsupportedModelError for
// higher-order factors.
[[nodiscard]] CfaModelSpec parse_model_syntax(const std::string& text, bool require_values);

// Renders a model with three-decimal coefficients; parse_model_syntax(..., true)
// reads it back.
[[nodiscard]] std::string format_model_syntax(const CfaModelSpec& spec);

}  // namespace libdynfit
