#pragma once

#include "libdynfit/cfa_model.hpp"

#include <cstddef>

namespace libdynfit {

// A validated standardized model together with the sample size the cutoffs
// are calibrated for.
struct ResolvedModel {
    CfaModelSpec spec;
    std::size_t sample_size{0};
};

// Checks, in order, and throws the first failure:
//   InvalidParameterError        |loading| or |correlation| >= 1
//   UnsupportedModelError        fewer than 2 factors
//   IdentificationError          residual degrees of freedom <= 0
//   InsufficientCandidatesError  fewer free items than factors - 1
void validate_model(const CfaModelSpec& spec);

}  // namespace libdynfit
