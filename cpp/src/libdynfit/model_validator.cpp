#include "libdynfit/model_validator.hpp"

#include "libdynfit/errors.hpp"
#include "libdynfit/misspecification.hpp"

#include <cmath>
#include <string>

namespace libdynfit {

namespace {
void check_magnitude(double value, const std::string& what) {
    if (!std::isfinite(value) || std::abs(value) >= 1.0) {
        throw InvalidParameterError("standardized " + what + " must have magnitude below 1 (got " +
                                    std::to_string(value) + ")");
    }
}
}  // namespace

void validate_model(const CfaModelSpec& spec) {
    for (const auto& factor : spec.factors) {
        for (const auto& indicator : factor.indicators) {
            check_magnitude(indicator.loading, "loading " + factor.name + " =~ " + indicator.item);
        }
    }
    for (const auto& corr : spec.factor_correlations) {
        check_magnitude(corr.value, "factor correlation " + corr.left + " ~~ " + corr.right);
    }
    for (const auto& corr : spec.residual_correlations) {
        check_magnitude(corr.value, "residual correlation " + corr.left + " ~~ " + corr.right);
    }

    const std::size_t factors = factor_count(spec);
    if (factors < 2) {
        throw UnsupportedModelError("dynamic fit cutoffs require a model with at least 2 factors (found " +
                                    std::to_string(factors) + ")");
    }

    const long df = degrees_of_freedom(spec);
    if (df <= 0) {
        throw IdentificationError("model has " + std::to_string(df) +
                                  " residual degrees of freedom; cutoffs need an over-identified model");
    }

    const std::size_t candidates = enumerate_candidates(spec).size();
    if (candidates < factors - 1) {
        throw InsufficientCandidatesError("model has " + std::to_string(candidates) +
                                          " items that can take a cross-loading (no existing cross-loading or residual "
                                          "correlation, communality room below .95); " +
                                          std::to_string(factors - 1) + " are needed");
    }
}

}  // namespace libdynfit
